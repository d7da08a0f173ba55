#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace ModelFusion {

// Named field-name rule applied to serialized output.
struct RoleFilter {
    enum class Kind {
        whitelist,
        blacklist,
        wholelist
    };

    Kind                     kind = Kind::wholelist;
    std::vector<std::string> names;

    bool allows(std::string_view name) const {
        const bool listed = std::ranges::find(names, name) != names.end();
        switch (kind) {
        case Kind::whitelist: return listed;
        case Kind::blacklist: return !listed;
        case Kind::wholelist: return true;
        }
        return true;
    }

    Value::Object apply(const Value::Object& fields) const {
        Value::Object out;
        for (const auto& [name, value] : fields) {
            if (allows(name)) {
                out.emplace(name, value);
            }
        }
        return out;
    }

    friend bool operator==(const RoleFilter&, const RoleFilter&) = default;
};

constexpr std::string_view role_kind_to_string(RoleFilter::Kind k) {
    switch(k) {
    case RoleFilter::Kind::whitelist: return "whitelist"; break;
    case RoleFilter::Kind::blacklist: return "blacklist"; break;
    case RoleFilter::Kind::wholelist: return "wholelist"; break;
    }
    return "N/A";
}

template<class... Names>
RoleFilter whitelist(Names&&... names) {
    return RoleFilter{RoleFilter::Kind::whitelist, {std::string(std::forward<Names>(names))...}};
}

template<class... Names>
RoleFilter blacklist(Names&&... names) {
    return RoleFilter{RoleFilter::Kind::blacklist, {std::string(std::forward<Names>(names))...}};
}

inline RoleFilter wholelist() {
    return RoleFilter{RoleFilter::Kind::wholelist, {}};
}

using Roles = std::map<std::string, RoleFilter, std::less<>>;

} // namespace ModelFusion
