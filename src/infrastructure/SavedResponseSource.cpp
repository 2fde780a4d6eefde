#include "infrastructure/SavedResponseSource.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mld::infrastructure {

SavedResponseSource::SavedResponseSource(std::string search_path, std::string system_path)
    : search_path_(std::move(search_path)), system_path_(std::move(system_path)) {}

std::vector<mld::domain::RawPayload> SavedResponseSource::fetch_payloads() {
    return parser_.parse_search(read_file(search_path_));
}

std::vector<mld::domain::CategoryInfo> SavedResponseSource::fetch_categories() {
    if (system_path_.empty()) return {};
    return parser_.parse_system(read_file(system_path_));
}

std::string SavedResponseSource::read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace mld::infrastructure
