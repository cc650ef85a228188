#include "BulkEncoder.hpp"
#include "../errors/PipelineError.hpp"

#include <algorithm>
#include <charconv> // to_chars/from_chars: locale-free, shortest-path number formatting
#include <cmath>
#include <limits>

namespace ExecAggregator
{

    // =========================================================================
    // COPY TEXT ESCAPING
    // =========================================================================
    // In COPY TEXT format a tab ends a field and a newline ends a row, so both
    // must be escaped inside values. Backslash is the escape character itself.
    // Exchange/instrument names are validated upstream, but the encoder must be
    // safe on its own: it is the last thing before the wire.
    // =========================================================================
    static void append_escaped(std::string &out, std::string_view value)
    {
        for (char c : value)
        {
            switch (c)
            {
            case '\\':
                out += "\\\\";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
            }
        }
    }

    static std::string unescape(std::string_view field)
    {
        std::string out;
        out.reserve(field.size());
        for (size_t i = 0; i < field.size(); ++i)
        {
            if (field[i] != '\\' || i + 1 == field.size())
            {
                out += field[i];
                continue;
            }
            char next = field[++i];
            switch (next)
            {
            case 't':
                out += '\t';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            default:
                out += next;
            }
        }
        return out;
    }

    template <typename Int>
    static void append_integer(std::string &out, Int value)
    {
        char buf[24]; // 20 digits + sign covers every 64-bit value
        auto result = std::to_chars(buf, buf + sizeof(buf), value);
        out.append(buf, result.ptr);
    }

    BulkEncoder::BulkEncoder(EncodingConfig config)
        : config_(config)
    {
    }

    void BulkEncoder::append_fixed(std::string &out, double value, int precision) const
    {
        // Fixed notation, fixed digits: 12.5 is always "12.50000000", never
        // "12.5" on one run and "1.25e+01" on another.
        char buf[512];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, precision);
        if (ec != std::errc{})
            throw PipelineError(ErrorKind::Encoding, "cannot format value " + std::to_string(value));
        out.append(buf, ptr);
    }

    std::uint64_t BulkEncoder::digest(std::string_view text)
    {
        std::uint64_t h = 14695981039346656037ull;
        for (unsigned char c : text)
        {
            h ^= c;
            h *= 1099511628211ull;
        }
        return h;
    }

    // =========================================================================
    // encode()
    // =========================================================================
    // Output (one line per row, fields separated by TAB):
    //   bitflyer  BTC_JPY  100  B  5.00000000  2  10.00000000  12.00000000  12.00000000  10.00000000  1  2
    // =========================================================================
    BulkPayload BulkEncoder::encode(const std::vector<AggregatedRow> &rows) const
    {
        BulkPayload payload;
        if (rows.empty())
            return payload;

        // Validate everything first: a failure must not leave a half-built payload
        // that some caller might be tempted to send.
        for (const auto &r : rows)
        {
            for (double v : {r.volume_sum, r.price_open, r.price_close, r.price_high, r.price_low})
            {
                if (!std::isfinite(v))
                {
                    throw PipelineError(ErrorKind::Encoding, r.partition,
                                        SequenceRange{r.first_sequence - 1, r.last_sequence},
                                        "non-finite value in aggregated row at timestamp " +
                                            std::to_string(r.timestamp));
                }
            }
        }

        std::string text;
        text.reserve(rows.size() * 128);

        Sequence first = std::numeric_limits<Sequence>::max();
        Sequence last = std::numeric_limits<Sequence>::min();

        for (const auto &r : rows)
        {
            append_escaped(text, r.partition.exchange);
            text += '\t';
            append_escaped(text, r.partition.instrument);
            text += '\t';
            append_integer(text, r.timestamp);
            text += '\t';
            text += to_char(r.side);
            text += '\t';
            append_fixed(text, r.volume_sum, config_.volume_precision);
            text += '\t';
            append_integer(text, r.trade_count);
            text += '\t';
            append_fixed(text, r.price_open, config_.price_precision);
            text += '\t';
            append_fixed(text, r.price_close, config_.price_precision);
            text += '\t';
            append_fixed(text, r.price_high, config_.price_precision);
            text += '\t';
            append_fixed(text, r.price_low, config_.price_precision);
            text += '\t';
            append_integer(text, r.first_sequence);
            text += '\t';
            append_integer(text, r.last_sequence);
            text += '\n';

            first = std::min(first, r.first_sequence);
            last = std::max(last, r.last_sequence);
        }

        payload.text = std::move(text);
        payload.row_count = rows.size();
        payload.first_sequence = first;
        payload.last_sequence = last;
        payload.digest = digest(payload.text);
        return payload;
    }

    // =========================================================================
    // decode()
    // =========================================================================
    std::vector<AggregatedRow> BulkEncoder::decode(std::string_view text)
    {
        std::vector<AggregatedRow> rows;
        size_t line_no = 0;

        auto malformed = [&line_no](const std::string &what)
        {
            return PipelineError(ErrorKind::Encoding,
                                 "payload line " + std::to_string(line_no) + ": " + what);
        };

        while (!text.empty())
        {
            size_t nl = text.find('\n');
            if (nl == std::string_view::npos)
                throw malformed("missing line terminator");
            std::string_view line = text.substr(0, nl);
            text.remove_prefix(nl + 1);
            ++line_no;

            std::array<std::string_view, kColumns.size()> fields;
            size_t n = 0;
            while (true)
            {
                size_t tab = line.find('\t');
                if (n == fields.size())
                    throw malformed("too many fields");
                fields[n++] = line.substr(0, tab);
                if (tab == std::string_view::npos)
                    break;
                line.remove_prefix(tab + 1);
            }
            if (n != fields.size())
                throw malformed("expected " + std::to_string(fields.size()) + " fields, got " + std::to_string(n));

            auto number = [&](std::string_view f, auto &out, const char *column)
            {
                auto [ptr, ec] = std::from_chars(f.data(), f.data() + f.size(), out);
                if (ec != std::errc{} || ptr != f.data() + f.size())
                    throw malformed(std::string("bad ") + column + " '" + std::string(f) + "'");
            };

            AggregatedRow r;
            r.partition.exchange = unescape(fields[0]);
            r.partition.instrument = unescape(fields[1]);
            number(fields[2], r.timestamp, "traded_at");

            auto side = fields[3].size() == 1 ? side_from_char(fields[3][0]) : std::nullopt;
            if (!side)
                throw malformed("bad side '" + std::string(fields[3]) + "'");
            r.side = *side;

            number(fields[4], r.volume_sum, "volume_sum");
            number(fields[5], r.trade_count, "trade_count");
            number(fields[6], r.price_open, "price_open");
            number(fields[7], r.price_close, "price_close");
            number(fields[8], r.price_high, "price_high");
            number(fields[9], r.price_low, "price_low");
            number(fields[10], r.first_sequence, "first_sequence");
            number(fields[11], r.last_sequence, "last_sequence");

            rows.push_back(std::move(r));
        }

        return rows;
    }

} // namespace ExecAggregator
