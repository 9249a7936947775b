#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cctype>
#include <cstdint>

namespace reconciliation::adapters::primary {

/**
 * @brief Разбор сегментов пути без query string
 *
 * "/api/v1/reconciliations/7/match" -> ["api", "v1", "reconciliations", "7", "match"]
 */
class PathParams {
public:
    static std::vector<std::string> segments(const std::string& path) {
        std::string clean = path.substr(0, path.find('?'));
        std::vector<std::string> out;
        std::string current;
        for (char c : clean) {
            if (c == '/') {
                if (!current.empty()) out.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty()) out.push_back(current);
        return out;
    }

    static bool isNumeric(const std::string& segment) {
        if (segment.empty() || segment.size() > 18) return false;
        for (char c : segment) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    /**
     * @brief Положительный числовой id в сегменте index
     */
    static std::optional<int64_t> idAt(const std::string& path, size_t index) {
        auto parts = segments(path);
        if (index >= parts.size() || !isNumeric(parts[index])) {
            return std::nullopt;
        }
        int64_t id = std::stoll(parts[index]);
        if (id <= 0) return std::nullopt;
        return id;
    }
};

} // namespace reconciliation::adapters::primary
