#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

// Hotwords file, one bias word per line. The sidecar reads the same file.
class VocabularyStore {
public:
    explicit VocabularyStore(std::filesystem::path path);

    // Missing file is an empty vocabulary.
    std::expected<std::vector<std::string>, std::string> load() const;
    std::expected<void, std::string> save(const std::vector<std::string>& words) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};
