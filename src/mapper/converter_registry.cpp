#include "mapper/converter_registry.hpp"

#include <mutex>
#include <string>

namespace rowmap {

ConverterRegistry::ConverterRegistry() {
    register_builtin<bool>();
    register_builtin<int16_t>();
    register_builtin<int32_t>();
    register_builtin<int64_t>();
    register_builtin<float>();
    register_builtin<double>();
    register_builtin<std::string>();
    register_builtin<Uuid>();
}

std::optional<Converter> ConverterRegistry::find_converter(std::type_index type) const {
    std::shared_lock lock(mutex_);
    const auto it = converters_.find(type);
    if (it == converters_.end()) return std::nullopt;
    return it->second;
}

void ConverterRegistry::register_converter(std::type_index type, Converter converter) {
    std::unique_lock lock(mutex_);
    converters_.insert_or_assign(type, std::move(converter));
}

size_t ConverterRegistry::size() const {
    std::shared_lock lock(mutex_);
    return converters_.size();
}

} // namespace rowmap
