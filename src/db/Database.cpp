#include "Database.hpp"

#include <sqlite3.h>

#include <utility>

namespace junction::db
{
    namespace
    {
        constexpr const char *ACTIVE_CONFIG_KEY = "active_junction_config";

        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }

        // Owns one sqlite connection for the duration of a single operation
        class Connection
        {
        public:
            Connection(const std::string &file_path, std::string *error)
            {
                if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
                {
                    setError(error, handle ? sqlite3_errmsg(handle) : "failed to open database");
                    sqlite3_close(handle);
                    handle = nullptr;
                }
            }

            ~Connection()
            {
                if (handle)
                {
                    sqlite3_close(handle);
                }
            }

            Connection(const Connection &) = delete;
            Connection &operator=(const Connection &) = delete;

            bool isOpen() const { return handle != nullptr; }
            sqlite3 *get() const { return handle; }
            std::string lastError() const { return sqlite3_errmsg(handle); }

        private:
            sqlite3 *handle = nullptr;
        };

        class Statement
        {
        public:
            Statement(const Connection &connection, const char *sql)
            {
                if (sqlite3_prepare_v2(connection.get(), sql, -1, &stmt, nullptr) != SQLITE_OK)
                {
                    stmt = nullptr;
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool isPrepared() const { return stmt != nullptr; }
            sqlite3_stmt *get() const { return stmt; }

        private:
            sqlite3_stmt *stmt = nullptr;
        };
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    const std::string &Database::getFilePath() const
    {
        return file_path;
    }

    bool Database::initialize(std::string *error) const
    {
        Connection connection(file_path, error);
        if (!connection.isOpen())
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS junction_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL,"
            "updated_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
            ");";

        char *errmsg = nullptr;
        if (sqlite3_exec(connection.get(), create_sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            setError(error, errmsg ? errmsg : "failed to initialize schema");
            sqlite3_free(errmsg);
            return false;
        }
        return true;
    }

    bool Database::saveActiveConfigJson(const std::string &config_json, std::string *error) const
    {
        Connection connection(file_path, error);
        if (!connection.isOpen())
        {
            return false;
        }

        Statement upsert(connection,
                         "INSERT INTO junction_config(key, value) VALUES(?, ?) "
                         "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = CURRENT_TIMESTAMP;");
        if (!upsert.isPrepared())
        {
            setError(error, connection.lastError());
            return false;
        }

        sqlite3_bind_text(upsert.get(), 1, ACTIVE_CONFIG_KEY, -1, SQLITE_STATIC);
        sqlite3_bind_text(upsert.get(), 2, config_json.c_str(), static_cast<int>(config_json.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(upsert.get()) != SQLITE_DONE)
        {
            setError(error, connection.lastError());
            return false;
        }
        return true;
    }

    std::optional<std::string> Database::loadActiveConfigJson(std::string *error) const
    {
        Connection connection(file_path, error);
        if (!connection.isOpen())
        {
            return std::nullopt;
        }

        Statement select(connection, "SELECT value FROM junction_config WHERE key = ? LIMIT 1;");
        if (!select.isPrepared())
        {
            setError(error, connection.lastError());
            return std::nullopt;
        }
        sqlite3_bind_text(select.get(), 1, ACTIVE_CONFIG_KEY, -1, SQLITE_STATIC);

        const int step_rc = sqlite3_step(select.get());
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(select.get(), 0);
            return std::string(text ? reinterpret_cast<const char *>(text) : "");
        }

        if (step_rc != SQLITE_DONE)
        {
            setError(error, connection.lastError());
        }
        return std::nullopt;
    }
} // namespace junction::db
