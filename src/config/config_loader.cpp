#include "config/config_loader.hpp"
#include "mapper/type_registry.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace rowmap {

namespace {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error("Unclosed env var substitution at position " +
                                         std::to_string(i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// Reads an optional key; a present value of another type is reported
template<typename T>
std::optional<T> read_key(const toml::table& section, std::string_view section_name,
                          std::string_view key, std::vector<std::string>& errors) {
    const auto node = section[key];
    if (!node) return std::nullopt;
    if (auto v = node.template value<T>()) return v;
    errors.push_back(std::string(section_name) + "." + std::string(key) + " has the wrong type");
    return std::nullopt;
}

std::optional<std::string> read_string(const toml::table& section, std::string_view section_name,
                                       std::string_view key, std::vector<std::string>& errors) {
    const auto* v = section[key].as_string();
    if (!v) {
        if (section[key]) {
            errors.push_back(std::string(section_name) + "." + std::string(key) +
                             " must be a string");
        }
        return std::nullopt;
    }
    return expand_env_vars(std::string(v->get()));
}

// ---- Section extractors ----------------------------------------------------

void extract_mapping(const toml::table& root, MappingSection& out,
                     std::vector<std::string>& errors) {
    const auto* mapping = root["mapping"].as_table();
    if (!mapping) return;
    const auto& m = *mapping;

    NamingRules rules;
    if (auto v = read_key<bool>(m, "mapping", "case_sensitive", errors)) {
        rules.case_sensitive = *v;
    }
    if (auto v = read_key<bool>(m, "mapping", "camel_case_to_underscore", errors)) {
        rules.camel_case_to_underscore = *v;
    }
    out.mapping.set_naming_rules(rules);

    if (auto v = read_key<bool>(m, "mapping", "strict_matching", errors)) {
        out.mapping.set_strict_matching(*v);
    }
    if (auto v = read_string(m, "mapping", "prefix", errors)) {
        out.prefix = *v;
    }
}

void extract_transactions(const toml::table& root, TransactionsSection& out,
                          std::vector<std::string>& errors) {
    const auto* transactions = root["transactions"].as_table();
    if (!transactions) return;

    if (auto v = read_string(*transactions, "transactions", "dialect", errors)) {
        try {
            out.dialect = parse_database_type(*v);
        } catch (const std::runtime_error& e) {
            errors.push_back(std::string("transactions.dialect: ") + e.what());
        }
    }
    if (auto v = read_string(*transactions, "transactions", "default_isolation", errors)) {
        const auto level = parse_isolation_level(*v);
        if (!level) {
            errors.push_back("transactions.default_isolation: unknown isolation level '" +
                             *v + "'");
        } else {
            out.default_isolation = *level;
        }
    }
}

void extract_logging(const toml::table& root, LoggingSection& out,
                     std::vector<std::string>& errors) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return;

    if (auto v = read_string(*logging, "logging", "level", errors)) {
        const auto level = utils::log::parse_level(*v);
        if (!level) {
            errors.push_back("logging.level: unknown log level '" + *v + "'");
        } else {
            out.level = *level;
        }
    }
}

ConfigLoader::LoadResult extract_all_sections(const toml::table& root) {
    RowmapConfig config;
    std::vector<std::string> errors;

    extract_mapping(root, config.mapping, errors);
    extract_transactions(root, config.transactions, errors);
    extract_logging(root, config.logging, errors);

    if (!errors.empty()) {
        return ConfigLoader::LoadResult::error("Config validation failed: " +
                                               utils::join(errors, "; "));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to load config: ") + e.what());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to parse config: ") + e.what());
    }
}

void ConfigLoader::apply(const RowmapConfig& config) {
    utils::log::set_level(config.logging.level);
    utils::log::info(std::string("rowmap config applied: strict_matching=") +
                     (config.mapping.mapping.is_strict_matching() ? "true" : "false") +
                     ", dialect=" +
                     std::string(database_type_to_string(config.transactions.dialect)) +
                     ", default_isolation=" +
                     isolation_level_to_string(config.transactions.default_isolation));
}

MapperContext ConfigLoader::mapper_context(std::shared_ptr<const TypeRegistry> types,
                                           const RowmapConfig& config) {
    return MapperContext::create(std::move(types), config.mapping.mapping);
}

std::shared_ptr<BeanMapperFactory> ConfigLoader::mapper_factory(
    std::shared_ptr<const TypeRegistry> types, const RowmapConfig& config) {
    return std::make_shared<BeanMapperFactory>(mapper_context(std::move(types), config),
                                               config.mapping.prefix);
}

Handle::Config ConfigLoader::transaction_config(const RowmapConfig& config) {
    Handle::Config handle_config;
    handle_config.dialect = config.transactions.dialect;
    handle_config.default_isolation = config.transactions.default_isolation;
    return handle_config;
}

} // namespace rowmap
