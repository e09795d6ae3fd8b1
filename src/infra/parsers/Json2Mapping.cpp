#include "Json2Mapping.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "PartialFileGuard.hpp"

namespace {

// --- Helpers ---

template <class T>
T require(const json::object& obj, const char* key) {
    if (!obj.contains(key)) {
        throw std::runtime_error(std::string("Missing required key: ") + key);
    }
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse key '") + key + "': " + e.what());
    }
}

template <class T>
T get_or(const json::object& obj, const char* key, T default_val) {
    if (!obj.contains(key) || obj.at(key).is_null()) return default_val;
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse key '") + key + "': " + e.what());
    }
}

AlbumMapping parse_mapping_entry(const TagId& tag, const json::value& v) {
    // Legacy form: "tag": "Album"
    if (v.is_string()) {
        return AlbumMapping{std::string(v.as_string()), false};
    }
    if (!v.is_object()) {
        throw std::runtime_error("Mapping for tag " + tag + " must be a string or an object");
    }

    const auto& entry = v.as_object();
    AlbumMapping mapping;
    mapping.album = require<std::string>(entry, "album");
    mapping.shuffle = get_or<bool>(entry, "shuffle", false);

    if (mapping.album.empty()) {
        throw std::runtime_error("Mapping for tag " + tag + " has an empty album name");
    }
    return mapping;
}

void pretty_print(std::ostream& os, const json::value& jv, std::string& indent) {
    switch (jv.kind()) {
        case json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) {
                os << "{}";
                break;
            }
            os << "{\n";
            indent.append(2, ' ');
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                if (it != obj.begin()) os << ",\n";
                os << indent << json::serialize(it->key()) << ": ";
                pretty_print(os, it->value(), indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "}";
            break;
        }
        case json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) {
                os << "[]";
                break;
            }
            os << "[\n";
            indent.append(2, ' ');
            for (auto it = arr.begin(); it != arr.end(); ++it) {
                if (it != arr.begin()) os << ",\n";
                os << indent;
                pretty_print(os, *it, indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "]";
            break;
        }
        default:
            os << json::serialize(jv);
            break;
    }
}

}  // namespace

//  Mapping Parser
MappingFile parse_mapping_file(const json::object& o) {
    MappingFile file{};

    // --- Phase 1: Music root ---
    file.music_root = require<std::string>(o, "usb_mount_path");

    // --- Phase 2: Tag mappings ---
    if (o.contains("nfc_mappings")) {
        const json::object& mappings = require<json::object>(o, "nfc_mappings");
        for (const auto& [key, value] : mappings) {
            TagId tag(key);
            file.mappings[tag] = parse_mapping_entry(tag, value);
        }
    }

    // --- Phase 3: Audio settings ---
    if (o.contains("audio_settings")) {
        const json::object& audio = require<json::object>(o, "audio_settings");
        file.volume = get_or<double>(audio, "volume", DEFAULT_VOLUME);
        if (file.volume < 0.0 || file.volume > 1.0) {
            throw std::runtime_error("audio_settings.volume must be between 0.0 and 1.0");
        }
    }

    return file;
}

json::object mapping_file_to_json(const MappingFile& file) {
    json::object mappings;
    for (const auto& [tag, mapping] : file.mappings) {
        mappings[tag] = json::object{{"album", mapping.album}, {"shuffle", mapping.shuffle}};
    }

    json::object root;
    root["usb_mount_path"] = file.music_root.string();
    root["nfc_mappings"] = std::move(mappings);
    root["audio_settings"] = json::object{{"volume", file.volume}};
    return root;
}

std::string pretty_print(const json::value& jv) {
    std::ostringstream os;
    std::string indent;
    pretty_print(os, jv, indent);
    os << "\n";
    return os.str();
}

MappingFile LoadMappingFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open mapping file: " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    boost::system::error_code ec;
    json::value root = json::parse(buffer.str(), ec);
    if (ec) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + ec.message());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Mapping file root must be an object: " + path.string());
    }

    MappingFile file = parse_mapping_file(root.as_object());
    spdlog::info("Loaded {} tag mappings from {}", file.mappings.size(), path.string());
    return file;
}

void SaveMappingFile(const std::filesystem::path& path, const MappingFile& file) {
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";

    // Removes the temporary file if anything below throws
    PartialFileGuard guard(tmp_path);
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write mapping file: " + tmp_path.string());
        }
        out << pretty_print(mapping_file_to_json(file));
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed while writing " + tmp_path.string());
        }
    }
    guard.commit(path);

    spdlog::info("Saved {} tag mappings to {}", file.mappings.size(), path.string());
}
