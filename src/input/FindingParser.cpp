#include "input/FindingParser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

#include "utils/StringUtils.hpp"

namespace Triage
{
    namespace Input
    {
        namespace
        {
            constexpr int kMaxNesting = 32;

            void appendUtf8(std::string &out, std::uint32_t cp)
            {
                if (cp < 0x80)
                {
                    out.push_back(static_cast<char>(cp));
                }
                else if (cp < 0x800)
                {
                    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
                else if (cp < 0x10000)
                {
                    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
                else
                {
                    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }

            /**
             * Forward-only cursor over a JSON text. Every read* method
             * returns std::nullopt (or false) on a syntax error and leaves
             * a message in error().
             */
            class JsonCursor
            {
            public:
                explicit JsonCursor(std::string_view text)
                    : m_text(text), m_pos(0)
                {
                }

                void skipWs() noexcept
                {
                    while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])) != 0)
                        ++m_pos;
                }

                bool atEnd() noexcept
                {
                    skipWs();
                    return m_pos >= m_text.size();
                }

                char peek() noexcept
                {
                    skipWs();
                    return m_pos < m_text.size() ? m_text[m_pos] : '\0';
                }

                bool consume(char c) noexcept
                {
                    if (peek() != c)
                        return false;
                    ++m_pos;
                    return true;
                }

                bool expect(char c)
                {
                    if (consume(c))
                        return true;
                    return fail(std::string("expected '") + c + "'");
                }

                std::optional<std::string> readString()
                {
                    if (!expect('"'))
                        return std::nullopt;

                    std::string out;
                    while (m_pos < m_text.size())
                    {
                        const char c = m_text[m_pos++];
                        if (c == '"')
                            return out;
                        if (c != '\\')
                        {
                            out.push_back(c);
                            continue;
                        }
                        if (m_pos >= m_text.size())
                            break;

                        const char esc = m_text[m_pos++];
                        switch (esc)
                        {
                        case '"':  out.push_back('"');  break;
                        case '\\': out.push_back('\\'); break;
                        case '/':  out.push_back('/');  break;
                        case 'b':  out.push_back('\b'); break;
                        case 'f':  out.push_back('\f'); break;
                        case 'n':  out.push_back('\n'); break;
                        case 'r':  out.push_back('\r'); break;
                        case 't':  out.push_back('\t'); break;
                        case 'u':
                        {
                            auto cp = readHex4();
                            if (!cp)
                                return std::nullopt;
                            std::uint32_t code = *cp;
                            // Surrogates only in high/low pairs
                            if (code >= 0xDC00 && code <= 0xDFFF)
                            {
                                fail("unpaired low surrogate in \\u escape");
                                return std::nullopt;
                            }
                            if (code >= 0xD800 && code <= 0xDBFF)
                            {
                                if (m_text.substr(m_pos, 2) != "\\u")
                                {
                                    fail("unpaired high surrogate in \\u escape");
                                    return std::nullopt;
                                }
                                m_pos += 2;
                                auto low = readHex4();
                                if (!low)
                                    return std::nullopt;
                                if (*low < 0xDC00 || *low > 0xDFFF)
                                {
                                    fail("invalid low surrogate in \\u escape");
                                    return std::nullopt;
                                }
                                code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                            }
                            appendUtf8(out, code);
                            break;
                        }
                        default:
                            fail(std::string("invalid escape '\\") + esc + "'");
                            return std::nullopt;
                        }
                    }
                    fail("unterminated string");
                    return std::nullopt;
                }

                /// Number, true, false or null as its raw token text.
                std::optional<std::string> readScalar()
                {
                    skipWs();
                    const std::size_t start = m_pos;
                    while (m_pos < m_text.size())
                    {
                        const char c = m_text[m_pos];
                        if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c)) != 0)
                            break;
                        ++m_pos;
                    }
                    if (m_pos == start)
                    {
                        fail("expected a value");
                        return std::nullopt;
                    }
                    return std::string(m_text.substr(start, m_pos - start));
                }

                std::optional<std::vector<std::string>> readStringArray()
                {
                    if (!expect('['))
                        return std::nullopt;

                    std::vector<std::string> values;
                    if (consume(']'))
                        return values;

                    do
                    {
                        auto value = readString();
                        if (!value)
                            return std::nullopt;
                        values.push_back(std::move(*value));
                    } while (consume(','));

                    if (!expect(']'))
                        return std::nullopt;
                    return values;
                }

                /**
                 * Iterate the members of an object. The callback receives the
                 * key with the cursor positioned at the value and must consume
                 * the value; it returns false to abort.
                 */
                template <typename Fn>
                bool readObject(Fn &&onMember)
                {
                    if (!expect('{'))
                        return false;
                    if (consume('}'))
                        return true;

                    do
                    {
                        auto key = readString();
                        if (!key || !expect(':'))
                            return false;
                        if (!onMember(*key))
                            return false;
                    } while (consume(','));

                    return expect('}');
                }

                bool skipValue(int depth = 0)
                {
                    if (depth > kMaxNesting)
                        return fail("nesting too deep");

                    switch (peek())
                    {
                    case '"':
                        return readString().has_value();
                    case '{':
                        return readObject([this, depth](const std::string &) { return skipValue(depth + 1); });
                    case '[':
                    {
                        ++m_pos;
                        if (consume(']'))
                            return true;
                        do
                        {
                            if (!skipValue(depth + 1))
                                return false;
                        } while (consume(','));
                        return expect(']');
                    }
                    default:
                        return readScalar().has_value();
                    }
                }

                bool isNull()
                {
                    skipWs();
                    if (m_text.substr(m_pos, 4) == "null")
                    {
                        m_pos += 4;
                        return true;
                    }
                    return false;
                }

                bool fail(std::string message)
                {
                    if (m_error.empty())
                        m_error = std::move(message) + " at offset " + std::to_string(m_pos);
                    return false;
                }

                const std::string &error() const noexcept { return m_error; }

            private:
                std::optional<std::uint32_t> readHex4()
                {
                    if (m_pos + 4 > m_text.size())
                    {
                        fail("truncated \\u escape");
                        return std::nullopt;
                    }
                    std::uint32_t value = 0;
                    for (int i = 0; i < 4; ++i)
                    {
                        const char c = m_text[m_pos++];
                        value <<= 4;
                        if (c >= '0' && c <= '9')      value |= static_cast<std::uint32_t>(c - '0');
                        else if (c >= 'a' && c <= 'f') value |= static_cast<std::uint32_t>(c - 'a' + 10);
                        else if (c >= 'A' && c <= 'F') value |= static_cast<std::uint32_t>(c - 'A' + 10);
                        else
                        {
                            fail("bad hex digit in \\u escape");
                            return std::nullopt;
                        }
                    }
                    return value;
                }

            private:
                std::string_view m_text;
                std::size_t      m_pos;
                std::string      m_error;
            };

            // Raw field values as they appear in the line; resolved afterwards
            // so key order does not matter.
            struct Fields
            {
                std::optional<std::string> id;
                std::optional<std::string> messageHash;
                std::optional<std::string> message;
                std::optional<std::string> rawMessage;
                std::optional<std::string> requestId;
                std::optional<std::string> jobName;
                std::optional<std::string> jobState;
                std::optional<std::string> severity;
                std::optional<std::string> normalizedMessage;
                std::optional<std::string> confidence;
                std::optional<std::string> recurrence;
                std::optional<std::vector<std::string>> preContext;
                std::optional<std::vector<std::string>> postContext;
                std::optional<std::string> metaJobState;
                std::optional<std::string> metaRecurrence;
            };

            // String or null; null leaves the field unset.
            bool readText(JsonCursor &cursor, std::optional<std::string> &out)
            {
                if (cursor.isNull())
                    return true;
                out = cursor.readString();
                return out.has_value();
            }

            // Number token or numeric string.
            bool readNumber(JsonCursor &cursor, std::optional<std::string> &out)
            {
                if (cursor.isNull())
                    return true;
                out = cursor.peek() == '"' ? cursor.readString() : cursor.readScalar();
                return out.has_value();
            }

            bool readLines(JsonCursor &cursor, std::optional<std::vector<std::string>> &out)
            {
                if (cursor.isNull())
                    return true;
                out = cursor.readStringArray();
                return out.has_value();
            }

            bool readMetadata(JsonCursor &cursor, Fields &fields)
            {
                if (cursor.isNull())
                    return true;
                return cursor.readObject([&cursor, &fields](const std::string &key)
                {
                    if (key == "job_state")
                        return readText(cursor, fields.metaJobState);
                    if (key == "recurrence_count")
                        return readNumber(cursor, fields.metaRecurrence);
                    return cursor.skipValue();
                });
            }
        } // anonymous namespace

        FindingParser::ParseResult FindingParser::parseLine(std::string_view line) const
        {
            ParseResult r;

            const auto trimmed = Utils::trim(line);
            if (trimmed.empty())
            {
                r.malformed = true;
                r.error = "Empty line";
                return r;
            }

            JsonCursor cursor(trimmed);
            Fields fields;

            const bool ok = cursor.readObject([&cursor, &fields](const std::string &key)
            {
                if (key == "id")                 return readText(cursor, fields.id);
                if (key == "message_hash")       return readText(cursor, fields.messageHash);
                if (key == "message")            return readText(cursor, fields.message);
                if (key == "raw_message")        return readText(cursor, fields.rawMessage);
                if (key == "request_id")         return readText(cursor, fields.requestId);
                if (key == "job_name")           return readText(cursor, fields.jobName);
                if (key == "job_state")          return readText(cursor, fields.jobState);
                if (key == "severity")           return readText(cursor, fields.severity);
                if (key == "normalized_message") return readText(cursor, fields.normalizedMessage);
                if (key == "confidence_score" || key == "confidence")
                    return readNumber(cursor, fields.confidence);
                if (key == "recurrence_count")   return readNumber(cursor, fields.recurrence);
                if (key == "pre_context")        return readLines(cursor, fields.preContext);
                if (key == "post_context")       return readLines(cursor, fields.postContext);
                if (key == "metadata")           return readMetadata(cursor, fields);
                return cursor.skipValue();
            });

            if (!ok)
            {
                r.malformed = true;
                r.error = cursor.error().empty() ? "Invalid JSON object" : cursor.error();
                return r;
            }
            if (!cursor.atEnd())
            {
                r.malformed = true;
                r.error = "Trailing characters after JSON object";
                return r;
            }

            auto id      = fields.messageHash ? fields.messageHash : fields.id;
            auto message = fields.rawMessage ? fields.rawMessage : fields.message;
            if (!id || id->empty() || !message)
            {
                r.malformed = true;
                r.error = std::string("Finding missing required fields:")
                          + (id && !id->empty() ? "" : " message_hash")
                          + (message ? "" : " raw_message");
                return r;
            }

            core::RawFinding finding;
            finding.id                = std::move(*id);
            finding.message           = std::move(*message);
            finding.requestId         = fields.requestId.value_or("");
            finding.jobName           = fields.jobName.value_or("");
            finding.severity          = fields.severity.value_or("");
            finding.normalizedPattern = fields.normalizedMessage.value_or("");
            finding.preContext        = fields.preContext.value_or(std::vector<std::string>{});
            finding.postContext       = fields.postContext.value_or(std::vector<std::string>{});

            const auto jobState = fields.jobState ? fields.jobState : fields.metaJobState;
            finding.jobOutcome = core::parseJobOutcome(jobState.value_or(""));

            if (fields.confidence)
            {
                auto confidence = Utils::parseFloat<double>(*fields.confidence);
                if (!confidence)
                {
                    r.malformed = true;
                    r.error = "confidence_score is not a number: " + *fields.confidence;
                    return r;
                }
                finding.confidence = std::clamp(*confidence, 0.0, 1.0);
            }

            const auto recurrence = fields.recurrence ? fields.recurrence : fields.metaRecurrence;
            if (recurrence)
            {
                auto count = Utils::parseInteger<int>(*recurrence);
                if (!count)
                {
                    r.malformed = true;
                    r.error = "recurrence_count is not an integer: " + *recurrence;
                    return r;
                }
                finding.recurrenceCount = std::max(1, *count);
            }

            r.finding = std::move(finding);
            return r;
        }

    } // namespace Input
} // namespace Triage
