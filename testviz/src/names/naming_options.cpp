#include "names/naming_options.hpp"

#include <algorithm>

namespace testviz::names {

auto NamingOptions::defaults() -> NamingOptions {
    NamingOptions options;
    options.no_split = {"HostBuilder", "DBSyncer", "DbSynchronizer"};
    options.no_transform = {"DbSynchronizer", "DBSyncer"};
    return options;
}

auto NamingOptions::is_no_split_prefix(std::string_view text) const -> bool {
    return std::any_of(no_split.begin(), no_split.end(),
                       [text](const std::string& entry) { return entry.starts_with(text); });
}

auto NamingOptions::is_no_transform(std::string_view word) const -> bool {
    return std::find(no_transform.begin(), no_transform.end(), word) != no_transform.end();
}

} // namespace testviz::names
