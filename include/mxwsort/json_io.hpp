#pragma once

#include <json/json.h>

#include <filesystem>

namespace mxwsort {

/**
 * @brief Write a JSON document with two-space indentation
 * @throws IoError if the file cannot be written
 */
void write_json(const std::filesystem::path& path, const Json::Value& value);

/**
 * @brief Parse a JSON document from disk
 * @throws IoError if the file is missing or not valid JSON
 */
Json::Value read_json(const std::filesystem::path& path);

}  // namespace mxwsort
