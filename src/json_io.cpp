#include "mxwsort/json_io.hpp"
#include "mxwsort/errors.hpp"

#include <fstream>
#include <memory>

namespace mxwsort {

void write_json(const std::filesystem::path& path, const Json::Value& value) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IoError("Cannot create JSON file: " + path.string());
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &out);
    out << '\n';
    out.close();

    if (!out) {
        throw IoError("Failed writing JSON file: " + path.string());
    }
}

Json::Value read_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError("Cannot open JSON file: " + path.string());
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw IoError("Invalid JSON in " + path.string() + ": " + errors);
    }
    return root;
}

}  // namespace mxwsort
