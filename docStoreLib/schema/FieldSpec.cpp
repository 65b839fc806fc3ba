#include <docstore/schema/FieldSpec.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace DocStore {

namespace {

bool isNumeric(const Json::Value& v) {
    return v.type() == Json::intValue || v.type() == Json::uintValue || v.type() == Json::realValue;
}

bool isIntegerValue(const Json::Value& v) {
    if (v.type() == Json::intValue || v.type() == Json::uintValue)
        return true;
    // 3.0 처럼 소수부가 없는 실수도 정수로 본다.
    if (v.type() == Json::realValue) {
        double d = v.asDouble();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool matchesDate(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-')
        return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

std::string formatNumber(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15)
        return std::to_string(static_cast<long long>(v));
    std::string s = std::to_string(v);
    while (!s.empty() && s.back() == '0')
        s.pop_back();
    return s;
}

} // namespace

bool FieldSpec::typeMatches(const Json::Value& value, unsigned mask) const {
    auto has = [mask](FieldType t) { return (mask & static_cast<unsigned>(t)) != 0; };
    if (value.isNull())
        return has(FieldType::Null);
    if (value.isBool())
        return has(FieldType::Boolean);
    if (isNumeric(value))
        return has(FieldType::Number) || (has(FieldType::Integer) && isIntegerValue(value));
    if (value.isString())
        return has(FieldType::String);
    if (value.isArray())
        return has(FieldType::Array);
    if (value.isObject())
        return has(FieldType::Object);
    return false;
}

std::string FieldSpec::describeTypes(unsigned mask) const {
    static const std::pair<FieldType, const char*> kNames[] = {
        {FieldType::Integer, "integer"}, {FieldType::Number, "number"}, {FieldType::String, "string"},
        {FieldType::Boolean, "boolean"}, {FieldType::Array, "array"},   {FieldType::Object, "object"},
        {FieldType::Null, "null"},
    };
    std::string out;
    for (const auto& [type, label] : kNames) {
        if ((mask & static_cast<unsigned>(type)) == 0)
            continue;
        if (!out.empty())
            out += " or ";
        out += label;
    }
    return out;
}

bool FieldSpec::check(const Json::Value& value, std::vector<FieldViolation>& violations) const {
    const size_t before = violations.size();
    auto fail = [&](std::string message) { violations.push_back({name_, std::move(message)}); };

    if (!typeMatches(value, types_)) {
        fail("expected " + describeTypes(types_));
        return false;
    }

    if (isNumeric(value)) {
        const double d = value.asDouble();
        if (minimum_ && d < *minimum_)
            fail("must be >= " + formatNumber(*minimum_));
        if (maximum_ && d > *maximum_)
            fail("must be <= " + formatNumber(*maximum_));
        if (multipleOf_ && *multipleOf_ > 0) {
            double q = d / *multipleOf_;
            if (std::fabs(q - std::round(q)) > 1e-9)
                fail("must be a multiple of " + formatNumber(*multipleOf_));
        }
    }

    if (value.isString()) {
        const std::string s = value.asString();
        if (minLength_ && s.size() < *minLength_)
            fail("must be at least " + std::to_string(*minLength_) + " characters");
        if (date_ && !matchesDate(s))
            fail("must be a YYYY-MM-DD date");
        if (!enumValues_.empty() &&
            std::find(enumValues_.begin(), enumValues_.end(), s) == enumValues_.end())
            fail("'" + s + "' is not an allowed value");
    }

    if (value.isArray()) {
        for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
            const Json::Value& item = value[i];
            const std::string where = "item " + std::to_string(i);
            if (itemTypes_ != 0 && !typeMatches(item, itemTypes_)) {
                fail(where + ": expected " + describeTypes(itemTypes_));
                continue;
            }
            if (!itemEnum_.empty() && item.isString() &&
                std::find(itemEnum_.begin(), itemEnum_.end(), item.asString()) == itemEnum_.end())
                fail(where + ": '" + item.asString() + "' is not an allowed value");
        }
        if (uniqueItems_) {
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                for (Json::ArrayIndex j = i + 1; j < value.size(); ++j) {
                    if (value[i] == value[j]) {
                        fail("items must be unique");
                        i = value.size();
                        break;
                    }
                }
            }
        }
    }

    return violations.size() == before;
}

const FieldSpec* EntitySchema::find(const std::string& fieldName) const {
    for (const auto& f : fields) {
        if (f.name() == fieldName)
            return &f;
    }
    return nullptr;
}

std::string describeViolations(const std::vector<FieldViolation>& violations) {
    std::string out;
    for (const auto& v : violations) {
        if (!out.empty())
            out += "; ";
        out += v.field + ": " + v.message;
    }
    return out;
}

} // namespace DocStore
