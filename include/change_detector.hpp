// ===================== include/change_detector.hpp =====================
#pragma once
#include <optional>

#include "address_pair.hpp"
#include "geo_resolver.hpp"

namespace wanwatch
{
    enum class ChangeKind
    {
        FirstRun,
        Ipv4Changed,
        Ipv6Changed,
        BothChanged,
        Unchanged
    };

    const char *to_string(ChangeKind kind);

    // Built once per cycle, consumed by the dispatcher, then discarded.
    struct ChangeEvent
    {
        ChangeKind kind = ChangeKind::Unchanged;
        AddressPair current;
        AddressPair previous;
        std::optional<GeoInfo> geo;

        bool is_first_run() const { return kind == ChangeKind::FirstRun; }
        bool ipv4_changed() const { return current.ipv4 != previous.ipv4; }
        bool ipv6_changed() const { return current.ipv6 != previous.ipv6; }
    };

    class ChangeDetector
    {
    public:
        // Pure. Exact, null-aware string equality; no address normalisation.
        static ChangeKind classify(const AddressPair &current, const AddressPair &previous);

        static ChangeEvent make_event(AddressPair current, AddressPair previous,
                                      std::optional<GeoInfo> geo = std::nullopt);
    };
} // namespace wanwatch
