#pragma once

#include <optional>
#include <string>

namespace junction::db
{

    // Key/value store for the active junction configuration, backed by a sqlite file
    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;
        bool saveActiveConfigJson(const std::string &config_json, std::string *error = nullptr) const;

        // nullopt with an empty error means nothing has been stored yet
        std::optional<std::string> loadActiveConfigJson(std::string *error = nullptr) const;

        const std::string &getFilePath() const;

    private:
        std::string file_path;
    };

} // namespace junction::db
