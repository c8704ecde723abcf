#include "vocabulary_store.hpp"

#include <fstream>

namespace fs = std::filesystem;

VocabularyStore::VocabularyStore(fs::path path)
    : path_(std::move(path)) {}

std::expected<std::vector<std::string>, std::string> VocabularyStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return std::vector<std::string>{};

    std::ifstream f(path_);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path_.string());
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        words.push_back(std::move(line));
    }
    return words;
}

std::expected<void, std::string> VocabularyStore::save(const std::vector<std::string>& words) const {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("could not write " + path_.string());
    }

    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) f << '\n';
        f << words[i];
    }
    f.flush();
    if (!f) return std::unexpected("write failed for " + path_.string());
    return {};
}
