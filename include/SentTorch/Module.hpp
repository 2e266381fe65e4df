#pragma once

#include "Core.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace st {

using NamedParameter = std::pair<std::string, std::shared_ptr<Parameter>>;

// Base for layers that own parameters. Subclasses define their own
// forward signature.
class Module : public std::enable_shared_from_this<Module> {
private:
    std::map<std::string, std::shared_ptr<Parameter>> parameters;
    std::map<std::string, std::shared_ptr<Module>> children;

public:
    virtual ~Module() = default;

    void register_parameter(const std::string& name, const std::shared_ptr<Parameter>& param) {
        parameters[name] = param;
    }

    void add_module(const std::string& name, const std::shared_ptr<Module>& module) {
        children[name] = module;
    }

    std::vector<std::shared_ptr<Parameter>> get_parameters() const {
        std::vector<std::shared_ptr<Parameter>> all_params;
        for (const auto& named : named_parameters()) {
            all_params.push_back(named.second);
        }
        return all_params;
    }

    /// Parameters keyed by dotted path, e.g. "layer_0.wx.weight", in name order.
    std::vector<NamedParameter> named_parameters(const std::string& prefix = "") const {
        std::vector<NamedParameter> all_params;
        for (const auto& pair : parameters) {
            all_params.emplace_back(prefix + pair.first, pair.second);
        }
        for (const auto& pair : children) {
            auto child_params = pair.second->named_parameters(prefix + pair.first + ".");
            all_params.insert(all_params.end(), child_params.begin(), child_params.end());
        }
        return all_params;
    }

    void cleargrads() {
        for (auto& param : get_parameters()) {
            param->cleargrad();
        }
    }
};

} // namespace st
