#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ShapeFusion {

enum class Requiredness : std::uint8_t {
    Required,
    Optional,
    Inclusive
};

// Describes one mapping field: the source key, the key it is written under
// in the result, and whether it must be present.
class Marker {
    std::string m_name;
    std::optional<std::string> m_renameTo;
    Requiredness m_requiredness = Requiredness::Optional;
    std::string m_monitor;

protected:
    Marker(std::string name, std::optional<std::string> renameTo, Requiredness r, std::string monitor = {})
        : m_name(std::move(name))
        , m_renameTo(std::move(renameTo))
        , m_requiredness(r)
        , m_monitor(std::move(monitor))
    {}

    void setMonitor(std::string group) { m_monitor = std::move(group); }

public:
    const std::string & name() const { return m_name; }
    const std::string & targetKey() const { return m_renameTo ? *m_renameTo : m_name; }
    bool isRenamed() const { return m_renameTo.has_value() && *m_renameTo != m_name; }
    Requiredness requiredness() const { return m_requiredness; }

    // Monitor group of an Inclusive marker; empty for the others.
    const std::string & monitorGroup() const { return m_monitor; }
};

struct Required : Marker {
    Required(std::string name, std::optional<std::string> renameTo = std::nullopt)
        : Marker(std::move(name), std::move(renameTo), Requiredness::Required)
    {}
};

struct Optional : Marker {
    Optional(std::string name, std::optional<std::string> renameTo = std::nullopt)
        : Marker(std::move(name), std::move(renameTo), Requiredness::Optional)
    {}
};

// Optional on its own; inside a monitor group, either all members are
// present or none (checked when inclusive enforcement is enabled).
struct Inclusive : Marker {
    Inclusive(std::string name, std::optional<std::string> renameTo = std::nullopt, std::string monitor = {})
        : Marker(std::move(name), std::move(renameTo), Requiredness::Inclusive, std::move(monitor))
    {}

    Inclusive & monitor(std::string group) & {
        setMonitor(std::move(group));
        return *this;
    }
    Inclusive && monitor(std::string group) && {
        setMonitor(std::move(group));
        return std::move(*this);
    }
};

} // namespace ShapeFusion
