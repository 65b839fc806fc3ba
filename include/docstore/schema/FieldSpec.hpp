#pragma once
/// @file FieldSpec.hpp
/// @brief Closed-schema field declarations and per-field validation

#include <json/json.h>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace DocStore {

/// @brief JSON value kinds a field may hold (bit flags)
enum class FieldType : unsigned {
    Null = 1u << 0,
    Boolean = 1u << 1,
    Integer = 1u << 2,
    Number = 1u << 3, ///< Any numeric value, integral or not
    String = 1u << 4,
    Array = 1u << 5,
    Object = 1u << 6,
};

/// @brief One schema violation
struct FieldViolation {
    std::string field;   ///< Offending field name
    std::string message; ///< Human readable reason
};

/// @brief Declaration of one allowed field and its constraints
/// @details Built with the named constructors and chained modifiers:
/// @code
/// FieldSpec::number("rating").orNull().min(0).max(5).multipleOf(0.5)
/// @endcode
class FieldSpec {
  public:
    static FieldSpec integer(std::string name) { return FieldSpec(std::move(name), FieldType::Integer); }
    static FieldSpec number(std::string name) { return FieldSpec(std::move(name), FieldType::Number); }
    static FieldSpec string(std::string name) { return FieldSpec(std::move(name), FieldType::String); }
    static FieldSpec boolean(std::string name) { return FieldSpec(std::move(name), FieldType::Boolean); }
    static FieldSpec array(std::string name, FieldType itemType) {
        FieldSpec f(std::move(name), FieldType::Array);
        f.itemTypes_ = static_cast<unsigned>(itemType);
        return f;
    }

    /// @brief Additionally accept JSON null
    FieldSpec& orNull() { return also(FieldType::Null); }
    /// @brief Additionally accept another JSON kind
    FieldSpec& also(FieldType t) {
        types_ |= static_cast<unsigned>(t);
        return *this;
    }
    FieldSpec& min(double v) {
        minimum_ = v;
        return *this;
    }
    FieldSpec& max(double v) {
        maximum_ = v;
        return *this;
    }
    FieldSpec& multipleOf(double v) {
        multipleOf_ = v;
        return *this;
    }
    FieldSpec& minLength(size_t n) {
        minLength_ = n;
        return *this;
    }
    /// @brief Restrict string values to a fixed set
    FieldSpec& oneOf(std::initializer_list<const char*> values) {
        enumValues_.assign(values.begin(), values.end());
        return *this;
    }
    /// @brief Require the `YYYY-MM-DD` shape for string values
    FieldSpec& date() {
        date_ = true;
        return *this;
    }
    /// @brief Restrict string array items to a fixed set
    FieldSpec& itemsOneOf(std::initializer_list<const char*> values) {
        itemEnum_.assign(values.begin(), values.end());
        return *this;
    }
    /// @brief Array items must be pairwise distinct
    FieldSpec& unique() {
        uniqueItems_ = true;
        return *this;
    }

    const std::string& name() const noexcept { return name_; }
    bool accepts(FieldType t) const noexcept { return (types_ & static_cast<unsigned>(t)) != 0; }

    /// @brief Check `value` against every constraint of this field
    /// @param value Field value (present in the record)
    /// @param violations Appended with one entry per failed constraint
    /// @return true if no constraint failed
    bool check(const Json::Value& value, std::vector<FieldViolation>& violations) const;

  private:
    FieldSpec(std::string name, FieldType t) : name_(std::move(name)), types_(static_cast<unsigned>(t)) {}

    bool typeMatches(const Json::Value& value, unsigned mask) const;
    std::string describeTypes(unsigned mask) const;

    std::string name_;
    unsigned types_ = 0;
    std::optional<double> minimum_;
    std::optional<double> maximum_;
    std::optional<double> multipleOf_;
    std::optional<size_t> minLength_;
    std::vector<std::string> enumValues_;
    bool date_ = false;
    unsigned itemTypes_ = 0;
    std::vector<std::string> itemEnum_;
    bool uniqueItems_ = false;
};

/// @brief Closed schema of one entity type
struct EntitySchema {
    std::string entity;                ///< Entity type name, e.g. "products"
    bool lookup = false;               ///< Lookup-flavoured collection
    std::vector<std::string> required; ///< Fields that must be present
    std::vector<FieldSpec> fields;     ///< Complete allow-list

    /// @brief Field declaration by name, nullptr if the field is not allowed
    const FieldSpec* find(const std::string& fieldName) const;
    bool allows(const std::string& fieldName) const { return find(fieldName) != nullptr; }
};

/// @brief "a: reason; b: reason" summary for logs and error messages
std::string describeViolations(const std::vector<FieldViolation>& violations);

} // namespace DocStore
