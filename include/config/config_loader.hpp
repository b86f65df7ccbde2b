#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "mapper/mapping_config.hpp"
#include "mapper/row_mapper.hpp"
#include "transaction/transaction_handle.hpp"

#include <memory>
#include <optional>
#include <string>

namespace rowmap {

// ============================================================================
// Mapping Config (mirrors TOML hierarchy)
// ============================================================================

struct MappingSection {
    MappingConfig mapping;
    // Prefix applied by mapper factories built from this config
    std::string prefix;
};

// ============================================================================
// Transactions Config
// ============================================================================

struct TransactionsSection {
    DatabaseType dialect = DatabaseType::POSTGRESQL;
    IsolationLevel default_isolation = IsolationLevel::UNSPECIFIED;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingSection {
    utils::log::Level level = utils::log::Level::INFO;
};

struct RowmapConfig {
    MappingSection mapping;
    TransactionsSection transactions;
    LoggingSection logging;
};

/**
 * @brief Loads RowmapConfig from TOML
 *
 * Missing sections and keys take defaults. Unknown dialects, isolation
 * levels or log levels are load errors, as are values of the wrong TOML type.
 * String values may reference environment variables as ${NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RowmapConfig config;

        static LoadResult ok(RowmapConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from TOML file
     * @param config_path Path to rowmap.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply process-wide settings (log level)
     */
    static void apply(const RowmapConfig& config);

    /**
     * @brief Standard mapper wiring using the [mapping] naming and strictness settings
     */
    [[nodiscard]] static MapperContext mapper_context(std::shared_ptr<const TypeRegistry> types,
                                                      const RowmapConfig& config);

    /**
     * @brief Bean mapper factory over mapper_context(), with the [mapping] prefix
     */
    [[nodiscard]] static std::shared_ptr<BeanMapperFactory> mapper_factory(
        std::shared_ptr<const TypeRegistry> types, const RowmapConfig& config);

    // Handle settings from [transactions]
    [[nodiscard]] static Handle::Config transaction_config(const RowmapConfig& config);
};

} // namespace rowmap
