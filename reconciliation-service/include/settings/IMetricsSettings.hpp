#pragma once

#include <string>
#include <vector>

namespace reconciliation::settings {

/**
 * @brief Метаданные метрики для HELP и TYPE
 */
struct MetricDefinition {
    std::string name;
    std::string help;
    std::string type;   ///< "counter"
};

/**
 * @brief Набор метрик сервиса
 *
 * getAllKeys() перечисляет все ключи с labels заранее: они инициализируются
 * нулями и выводятся в /metrics даже до первого инкремента.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return Ключи в формате "metric_name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace reconciliation::settings
