#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace reconciliation::application {

/**
 * @brief Хранилище счётчиков Prometheus
 *
 * Чтение и инкремент существующего ключа идут под shared_lock,
 * новый ключ добавляется под unique_lock. Вывод сгруппирован по метрике:
 * HELP/TYPE, затем все её ключи в лексикографическом порядке.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }
        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;
        std::shared_lock<std::shared_mutex> lock(mutex_);

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            for (auto it = counters_.lower_bound(def.name); it != counters_.end(); ++it) {
                if (metricName(it->first) != def.name) {
                    if (it->first.compare(0, def.name.size(), def.name) != 0) break;
                    continue;
                }
                oss << it->first << " " << it->second->load(std::memory_order_relaxed) << "\n";
            }
        }
        return oss.str();
    }

    /**
     * @brief Текущее значение ключа (0 для неизвестного)
     */
    int64_t value(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        return it == counters_.end() ? 0 : it->second->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string metricName(const std::string& key) {
        return key.substr(0, key.find('{'));
    }

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels)
    {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace reconciliation::application
