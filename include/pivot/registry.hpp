#pragma once

#include "format.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    // Named implementations of a capability interface. Entries are registered explicitly at
    // startup; lookups create a fresh instance from the stored factory.
    template <typename Interface>
    class named_registry {
      public:
        using factory = std::function<std::unique_ptr<Interface>()>;

        void add(std::string name, factory make) {
            if (!make) {
                throw std::invalid_argument("registry factory must not be empty");
            }
            auto [it, inserted] = factories_.try_emplace(std::move(name), std::move(make));
            if (!inserted) {
                throw std::invalid_argument(std::format("duplicate registry entry: {}", it->first));
            }
        }

        // replaces an existing entry; used to override a builtin
        void replace(std::string name, factory make) { factories_.insert_or_assign(std::move(name), std::move(make)); }

        bool contains(std::string_view name) const { return factories_.find(name) != factories_.end(); }

        std::unique_ptr<Interface> create(std::string_view name) const {
            auto it = factories_.find(name);
            if (it == factories_.end()) {
                return nullptr;
            }
            return it->second();
        }

        std::vector<std::string> names() const {
            std::vector<std::string> out{};
            out.reserve(factories_.size());
            for (const auto& [name, _] : factories_) {
                out.push_back(name);
            }
            return out;
        }

      private:
        std::map<std::string, factory, std::less<>> factories_{};
    };

}  // namespace pivot
