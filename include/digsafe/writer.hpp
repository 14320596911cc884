#pragma once

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "digsafe/types.hpp"

namespace digsafe {

    namespace detail {
        inline std::string escape_string(const std::string &s) {
            std::string result;
            result.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        std::ostringstream hex;
                        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c));
                        result += hex.str();
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        inline std::string quoted(const std::string &s) { return "\"" + escape_string(s) + "\""; }

        inline std::string project_to_json(const Project &p) {
            std::ostringstream oss;
            oss << R"({"id":)" << quoted(p.id) << R"(,"name":)" << quoted(p.name) << R"(,"start_date":)"
                << quoted(p.window.start().to_string()) << R"(,"end_date":)" << quoted(p.window.end().to_string())
                << R"(,"work_category":)" << quoted(p.work_category) << "}";
            return oss.str();
        }

        inline std::string moratorium_to_json(const Moratorium &m) {
            std::ostringstream oss;
            oss << R"({"id":)" << quoted(m.id) << R"(,"name":)" << quoted(m.name) << R"(,"validTo":)"
                << quoted(m.window.end().to_string()) << R"(,"reason":)" << quoted(m.reason);
            if (m.reason_detail) {
                oss << R"(,"reasonDetail":)" << quoted(*m.reason_detail);
            }
            if (m.exceptions) {
                oss << R"(,"exceptions":)" << quoted(*m.exceptions);
            }
            oss << "}";
            return oss.str();
        }

        template <typename T, typename F> std::string array_to_json(const std::vector<T> &items, F &&render) {
            std::ostringstream oss;
            oss << "[";
            bool first = true;
            for (const auto &item : items) {
                if (!first)
                    oss << ",";
                first = false;
                oss << render(item);
            }
            oss << "]";
            return oss.str();
        }
    } // namespace detail

    /**
     * @brief Render a detection result as compact JSON
     *
     * Key order and formatting are fixed, so equal results always render to
     * identical bytes. Optional moratorium fields are omitted when unset.
     */
    inline std::string to_json(const ConflictDetectionResult &result) {
        std::ostringstream oss;
        oss << R"({"hasConflict":)" << (result.has_conflict ? "true" : "false");
        oss << R"(,"spatialConflicts":)" << detail::array_to_json(result.spatial_conflicts, detail::project_to_json);
        oss << R"(,"temporalConflicts":)" << detail::array_to_json(result.temporal_conflicts, detail::project_to_json);
        oss << R"(,"moratoriumViolations":)"
            << detail::array_to_json(result.moratorium_violations, detail::moratorium_to_json);
        oss << R"(,"acknowledgedMoratoriums":)"
            << detail::array_to_json(result.acknowledged_moratoriums, detail::moratorium_to_json);
        oss << R"(,"summary":{"totalConflicts":)" << result.summary.total_conflicts << R"(,"criticalConflicts":)"
            << result.summary.critical_conflicts << R"(,"warnings":)" << result.summary.warnings << "}}";
        return oss.str();
    }

} // namespace digsafe
