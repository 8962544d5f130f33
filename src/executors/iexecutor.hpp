#pragma once
#include "../plugin_types.hpp"

// An isolation backend. Implementations never throw out of execute(): every
// failure comes back as an error BatchResponse.
class IPluginExecutor {
public:
    virtual ~IPluginExecutor() = default;
    virtual const char* name() const = 0;
    virtual BatchResponse execute(const PluginBatch& batch) = 0;
};
