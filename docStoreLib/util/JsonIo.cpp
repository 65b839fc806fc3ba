#include <docstore/util/AtomicFile.hpp>
#include <docstore/util/JsonIo.hpp>
#include <docstore/util/StoreError.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>

namespace DocStore::util {

std::string toJsonText(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    builder["enableYAMLCompatibility"] = false;
    std::ostringstream os;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &os);
    os << '\n';
    return os.str();
}

bool parseJsonText(const std::string& text, Json::Value& out, std::string& errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    out = Json::Value();
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

bool readJsonFile(const std::string& path, Json::Value& out, std::error_code& ec) {
    std::string text;
    if (!readFile(path, text, ec))
        return false;

    std::string errors;
    if (!parseJsonText(text, out, errors)) {
        spdlog::error("malformed JSON in {}: {}", path, errors);
        ec = StoreErrc::CorruptCollection;
        return false;
    }
    return true;
}

bool writeJsonFileAtomic(const std::string& path, const Json::Value& value, std::error_code& ec) {
    return writeFileAtomic(path, toJsonText(value), ec);
}

} // namespace DocStore::util
