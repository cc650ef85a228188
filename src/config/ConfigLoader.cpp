#include "ConfigLoader.hpp"
#include "../errors/PipelineError.hpp"

#include <ctre.hpp> // Compile-time regex: line grammar and identifier checks
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h> // gethostname, getpid

namespace ExecAggregator
{

    // =========================================================================
    // Helpers
    // =========================================================================
    static std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r'))
            s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
            s.remove_suffix(1);
        return s;
    }

    [[noreturn]] static void config_error(int line_no, std::string_view key, const std::string &what)
    {
        std::string msg = "line " + std::to_string(line_no) + ": '" + std::string(key) + "' " + what;
        throw PipelineError(ErrorKind::Configuration, std::move(msg));
    }

    template <typename Int>
    static Int parse_integer(std::string_view value, std::string_view key, int line_no)
    {
        Int out{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
        if (ec != std::errc{} || ptr != value.data() + value.size())
            config_error(line_no, key, "expects an integer, got '" + std::string(value) + "'");
        return out;
    }

    static std::chrono::milliseconds parse_millis(std::string_view value, std::string_view key, int line_no)
    {
        auto ms = parse_integer<long long>(value, key, line_no);
        if (ms < 0)
            config_error(line_no, key, "must not be negative");
        return std::chrono::milliseconds(ms);
    }

    static bool parse_bool(std::string_view value, std::string_view key, int line_no)
    {
        if (value == "true" || value == "yes" || value == "on" || value == "1")
            return true;
        if (value == "false" || value == "no" || value == "off" || value == "0")
            return false;
        config_error(line_no, key, "expects true/false, got '" + std::string(value) + "'");
    }

    static std::string default_worker_id()
    {
        char host[256] = {};
        if (gethostname(host, sizeof(host) - 1) != 0)
            return "exec-aggregator-" + std::to_string(getpid());
        return std::string(host) + "-" + std::to_string(getpid());
    }

    // =========================================================================
    // Identifier grammar
    // =========================================================================
    bool ConfigLoader::is_sql_identifier(std::string_view name)
    {
        return static_cast<bool>(ctre::match<"[a-z_][a-z0-9_]{0,62}">(name));
    }

    bool ConfigLoader::is_partition_component(std::string_view name)
    {
        return static_cast<bool>(ctre::match<"[A-Za-z0-9_.-]{1,64}">(name));
    }

    std::vector<PartitionKey> ConfigLoader::parse_partition_list(std::string_view text)
    {
        std::vector<PartitionKey> keys;
        while (!text.empty())
        {
            size_t comma = text.find(',');
            std::string_view item = trim(text.substr(0, comma));
            text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);

            if (item.empty())
                continue;

            auto m = ctre::match<"([A-Za-z0-9_.-]{1,64})/([A-Za-z0-9_.-]{1,64})">(item);
            if (!m)
            {
                throw PipelineError(ErrorKind::Configuration,
                                    "invalid partition '" + std::string(item) + "', expected exchange/instrument");
            }
            keys.push_back(PartitionKey{m.get<1>().to_string(), m.get<2>().to_string()});
        }
        return keys;
    }

    // =========================================================================
    // apply(): one "key = value" pair onto the config
    // =========================================================================
    void ConfigLoader::apply(PipelineConfig &c, std::string_view key, std::string_view value, int line_no)
    {
        if (key == "database.url")
            c.database.url = std::string(value);
        else if (key == "database.raw_table")
            c.database.raw_table = std::string(value);
        else if (key == "database.aggregate_table")
            c.database.aggregate_table = std::string(value);
        else if (key == "database.watermark_table")
            c.database.watermark_table = std::string(value);
        else if (key == "database.lease_table")
            c.database.lease_table = std::string(value);
        else if (key == "database.source_has_side")
            c.database.source_has_side = parse_bool(value, key, line_no);
        else if (key == "database.init_schema")
            c.database.init_schema = parse_bool(value, key, line_no);
        else if (key == "batch.max_rows")
            c.batch.max_rows = parse_integer<std::size_t>(value, key, line_no);
        else if (key == "batch.tail_settle_ms")
            c.batch.tail_settle = parse_millis(value, key, line_no);
        else if (key == "scheduler.mode")
        {
            if (value == "drain")
                c.scheduler.mode = RunMode::Drain;
            else if (value == "follow")
                c.scheduler.mode = RunMode::Follow;
            else
                config_error(line_no, key, "expects drain or follow");
        }
        else if (key == "scheduler.max_workers")
            c.scheduler.max_workers = parse_integer<std::size_t>(value, key, line_no);
        else if (key == "scheduler.poll_interval_ms")
            c.scheduler.poll_interval = parse_millis(value, key, line_no);
        else if (key == "scheduler.max_attempts")
            c.scheduler.max_attempts = parse_integer<std::size_t>(value, key, line_no);
        else if (key == "scheduler.worker_id")
            c.scheduler.worker_id = std::string(value);
        else if (key == "scheduler.lease_ttl_ms")
            c.scheduler.lease_ttl = parse_millis(value, key, line_no);
        else if (key == "backoff.initial_ms")
            c.scheduler.backoff_initial = parse_millis(value, key, line_no);
        else if (key == "backoff.max_ms")
            c.scheduler.backoff_max = parse_millis(value, key, line_no);
        else if (key == "timeouts.fetch_ms")
            c.scheduler.fetch_timeout = parse_millis(value, key, line_no);
        else if (key == "timeouts.commit_ms")
            c.scheduler.commit_timeout = parse_millis(value, key, line_no);
        else if (key == "encoding.price_precision")
            c.encoding.price_precision = parse_integer<int>(value, key, line_no);
        else if (key == "encoding.volume_precision")
            c.encoding.volume_precision = parse_integer<int>(value, key, line_no);
        else if (key == "partitions.enable")
            c.enabled_partitions = parse_partition_list(value);
        else if (key == "partitions.disable")
            c.disabled_partitions = parse_partition_list(value);
        else if (key == "archive.directory")
            c.archive_directory = std::string(value);
        else
            config_error(line_no, key, "is not a known setting");
    }

    // =========================================================================
    // parse(): the whole file
    // =========================================================================
    // Grammar per line:   [ws] key [ws] = [ws] value [ws]   |   [ws] # comment   |   blank
    // Keys are dotted lower-case names ("scheduler.max_workers").
    // Values run to end of line; no quoting, so '#' inside a value is kept
    // (libpq connection strings may contain it in passwords).
    // =========================================================================
    PipelineConfig ConfigLoader::parse(std::string_view text)
    {
        PipelineConfig config;
        int line_no = 0;

        while (!text.empty())
        {
            size_t nl = text.find('\n');
            std::string_view line = text.substr(0, nl);
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
            ++line_no;

            std::string_view body = trim(line);
            if (body.empty() || body.front() == '#')
                continue;

            auto m = ctre::match<"([a-z][a-z0-9_]*(?:\\.[a-z][a-z0-9_]*)*)\\s*=(.*)">(body);
            if (!m)
            {
                throw PipelineError(ErrorKind::Configuration,
                                    "line " + std::to_string(line_no) + ": expected 'key = value', got '" +
                                        std::string(body) + "'");
            }

            apply(config, m.get<1>().to_view(), trim(m.get<2>().to_view()), line_no);
        }

        if (config.scheduler.worker_id.empty())
            config.scheduler.worker_id = default_worker_id();

        validate(config);
        return config;
    }

    PipelineConfig ConfigLoader::load(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw PipelineError(ErrorKind::Configuration, "cannot open config file " + path.string());

        std::ostringstream content;
        content << file.rdbuf();

        PipelineConfig config = parse(content.str());
        apply_environment(config);
        std::cout << "[CONFIG] Loaded " << path.string() << "\n";
        return config;
    }

    PipelineConfig ConfigLoader::defaults_with_environment()
    {
        PipelineConfig config = parse("");
        apply_environment(config);
        return config;
    }

    void ConfigLoader::apply_environment(PipelineConfig &config)
    {
        if (const char *url = std::getenv(kDatabaseUrlEnv); url != nullptr && *url != '\0')
        {
            config.database.url = url;
            std::cout << "[CONFIG] database.url taken from " << kDatabaseUrlEnv << "\n";
        }
    }

    // =========================================================================
    // validate()
    // =========================================================================
    void ConfigLoader::validate(const PipelineConfig &c)
    {
        auto fail = [](const std::string &msg)
        {
            throw PipelineError(ErrorKind::Configuration, msg);
        };

        const std::pair<const char *, const std::string *> tables[] = {
            {"database.raw_table", &c.database.raw_table},
            {"database.aggregate_table", &c.database.aggregate_table},
            {"database.watermark_table", &c.database.watermark_table},
            {"database.lease_table", &c.database.lease_table},
        };
        for (const auto &[key, name] : tables)
        {
            if (!is_sql_identifier(*name))
                fail(std::string(key) + " '" + *name + "' is not a plain SQL identifier");
        }

        if (c.database.url.empty())
            fail("database.url is empty");
        if (c.batch.max_rows == 0 || c.batch.max_rows > kMaxBatchRows)
            fail("batch.max_rows must be within 1.." + std::to_string(kMaxBatchRows));
        if (c.scheduler.mode == RunMode::Follow && c.batch.tail_settle.count() == 0)
            fail("batch.tail_settle_ms must be > 0 in follow mode");
        if (c.scheduler.max_workers == 0)
            fail("scheduler.max_workers must be > 0");
        if (c.scheduler.max_attempts == 0)
            fail("scheduler.max_attempts must be > 0");
        if (c.scheduler.backoff_initial.count() == 0 || c.scheduler.backoff_max < c.scheduler.backoff_initial)
            fail("backoff.initial_ms must be > 0 and <= backoff.max_ms");
        if (c.scheduler.fetch_timeout.count() == 0 || c.scheduler.commit_timeout.count() == 0)
            fail("timeouts must be > 0");
        if (c.scheduler.lease_ttl <= c.scheduler.fetch_timeout + c.scheduler.commit_timeout)
            fail("scheduler.lease_ttl_ms must exceed timeouts.fetch_ms + timeouts.commit_ms");
        if (c.encoding.price_precision < 0 || c.encoding.price_precision > 17 ||
            c.encoding.volume_precision < 0 || c.encoding.volume_precision > 17)
            fail("encoding precisions must be within 0..17");

        for (const auto &list : {&c.enabled_partitions, &c.disabled_partitions})
        {
            for (const auto &key : *list)
            {
                if (!is_partition_component(key.exchange) || !is_partition_component(key.instrument))
                    fail("invalid partition '" + key.to_string() + "'");
            }
        }
    }

} // namespace ExecAggregator
