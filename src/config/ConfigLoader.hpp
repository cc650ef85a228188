#pragma once

#include <string_view>
#include <filesystem>
#include <vector>
#include "PipelineConfig.hpp"

namespace ExecAggregator
{

    // Environment variable that overrides database.url, so credentials can stay
    // out of the config file.
    inline constexpr const char *kDatabaseUrlEnv = "EXEC_AGGREGATOR_DATABASE_URL";

    class ConfigLoader
    {
    public:
        /**
         * @brief Reads a "key = value" file (# starts a comment) on top of the
         * PipelineConfig defaults, applies the environment override and validates.
         * @throws PipelineError{Configuration} on unreadable file, unknown key,
         *         malformed value or failed validation.
         */
        [[nodiscard]]
        static PipelineConfig load(const std::filesystem::path &path);

        // Same as load() but from in-memory text. No environment override.
        [[nodiscard]]
        static PipelineConfig parse(std::string_view text);

        // Defaults + environment override, validated. Used when no file is given.
        [[nodiscard]]
        static PipelineConfig defaults_with_environment();

        // Throws PipelineError{Configuration} describing the first problem found.
        static void validate(const PipelineConfig &config);

        // "bitflyer/BTC_JPY, liquid/BTCJPY" -> two keys
        [[nodiscard]]
        static std::vector<PartitionKey> parse_partition_list(std::string_view text);

        static bool is_sql_identifier(std::string_view name);
        static bool is_partition_component(std::string_view name);

    private:
        static void apply(PipelineConfig &config, std::string_view key, std::string_view value, int line_no);
        static void apply_environment(PipelineConfig &config);
    };

} // namespace ExecAggregator
