#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <string>

#include "config.hpp"
#include "types.hpp"

/**
 * @brief Parses a boost::json object into a MappingFile.
 * @param o The root JSON object ("usb_mount_path", "nfc_mappings", "audio_settings").
 * @return  The parsed mappings. A mapping value may be an album name string
 *          (shuffle off) or an object {"album": ..., "shuffle": ...}.
 * @throws  std::runtime_error on missing keys or malformed values.
 */
MappingFile parse_mapping_file(const json::object& o);

/**
 * @brief Builds the JSON representation written back by the setup tool.
 * Mappings are always written in the object form.
 */
json::object mapping_file_to_json(const MappingFile& file);

/**
 * @brief Serializes a JSON value with two-space indentation.
 */
std::string pretty_print(const json::value& jv);

// File helpers. Both throw std::runtime_error on I/O or parse failures.
MappingFile LoadMappingFile(const std::filesystem::path& path);
void SaveMappingFile(const std::filesystem::path& path, const MappingFile& file);
