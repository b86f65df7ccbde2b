#pragma once

#include "mapper/property_descriptor.hpp"

#include <typeindex>

namespace rowmap {

/**
 * @brief Strategy that produces the property shape of a type
 *
 * C++ has no runtime reflection, so every strategy reads metadata that was
 * declared somewhere: a registration table, generated code, etc. The
 * catalog calls introspect() at most once per type and caches the result.
 */
class ITypeIntrospector {
public:
    virtual ~ITypeIntrospector() = default;

    [[nodiscard]] virtual bool supports(std::type_index type) const = 0;

    /**
     * @brief Build the shape of a type
     * @throws IntrospectionError if the type is unknown or has no properties
     */
    [[nodiscard]] virtual TypeShape introspect(std::type_index type) const = 0;
};

} // namespace rowmap
