/**
 * @file json_io.cpp
 * @brief JSON document file I/O
 */

#include "recon/json_io.hpp"

#include <fstream>

namespace recon::common {

recon::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            recon::Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            recon::Error::make("ParseError",
                               "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

recon::VoidResult write_json_file(const std::filesystem::path& path, const nlohmann::json& payload)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            recon::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    // nlohmann::json keeps object keys in a std::map, so dump() is already key-sorted.
    std::string text;
    try {
        text = payload.dump(2, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const std::exception& ex) {
        return std::unexpected(recon::Error::make(
            "SerializeError", "Failed to serialize " + path.string() + ": " + ex.what()));
    }
    out << text << "\n";
    if (!out) {
        return std::unexpected(
            recon::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace recon::common
