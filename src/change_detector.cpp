// ===================== src/change_detector.cpp =====================
#include "change_detector.hpp"

namespace wanwatch
{
    const char *to_string(ChangeKind kind)
    {
        switch (kind)
        {
        case ChangeKind::FirstRun:
            return "FirstRun";
        case ChangeKind::Ipv4Changed:
            return "Ipv4Changed";
        case ChangeKind::Ipv6Changed:
            return "Ipv6Changed";
        case ChangeKind::BothChanged:
            return "BothChanged";
        case ChangeKind::Unchanged:
            return "Unchanged";
        }
        return "Unknown";
    }

    ChangeKind ChangeDetector::classify(const AddressPair &current, const AddressPair &previous)
    {
        if (previous.empty())
            return ChangeKind::FirstRun;

        const bool v4 = current.ipv4 != previous.ipv4;
        const bool v6 = current.ipv6 != previous.ipv6;
        if (v4 && v6)
            return ChangeKind::BothChanged;
        if (v4)
            return ChangeKind::Ipv4Changed;
        if (v6)
            return ChangeKind::Ipv6Changed;
        return ChangeKind::Unchanged;
    }

    ChangeEvent ChangeDetector::make_event(AddressPair current, AddressPair previous, std::optional<GeoInfo> geo)
    {
        ChangeEvent ev;
        ev.kind = classify(current, previous);
        ev.current = std::move(current);
        ev.previous = std::move(previous);
        ev.geo = std::move(geo);
        return ev;
    }
} // namespace wanwatch
