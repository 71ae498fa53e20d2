#pragma once

#include <reachability/exceptions.hpp>
#include <reachability/types.hpp>

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reachability {

// Something that can originate a probe: a workload, a host, a container
template<typename S>
concept connection_source = requires(
    const S& source,
    const std::string& ip,
    const std::string& port,
    const std::string& protocol,
    const probe_options& options
) {
    { source.probe(ip, port, protocol, options) } -> std::same_as<std::optional<probe_result>>;
    { source.source_name() } -> std::convertible_to<std::string>;
    { source.source_ips() } -> std::convertible_to<std::vector<std::string>>;
};

// Something a probe can be aimed at. Resolution happens once, at registration.
template<typename T>
concept connection_target = requires(const T& target, std::optional<port_number> explicit_port) {
    { target.to_matcher(explicit_port) } -> std::same_as<target_matcher>;
};

// A bare IP address. It has no default port, so an explicit one is required.
class target_ip {
public:
    explicit target_ip(std::string ip) : _ip(std::move(ip)) {}

    auto to_matcher(std::optional<port_number> explicit_port) const -> target_matcher {
        if (!explicit_port) {
            throw configuration_exception(
                "Explicit port needed with IP as a connectivity target: " + _ip);
        }
        auto port = std::to_string(*explicit_port);
        return target_matcher{
            .ip = _ip,
            .port = port,
            .target_name = _ip + ":" + port,
            .protocol = std::nullopt
        };
    }

    auto ip() const -> const std::string& { return _ip; }

private:
    std::string _ip;
};

static_assert(connection_target<target_ip>, "target_ip must satisfy connection_target");
static_assert(!connection_source<target_ip>, "target_ip must not be usable as a source");

/**
 * @brief Type-erased handle to a connection source
 *
 * Expectations of one checker usually mix sources of different concrete
 * types, so they are stored behind this handle. The handle keeps its own copy
 * of the source, so a temporary passed at registration stays valid for every
 * later check. Sources that carry shared state (a runner, a recorder) share
 * it with the copy. A handle built from a shared_ptr shares ownership instead.
 */
class source_handle {
public:
    template<connection_source S>
    requires std::copy_constructible<S>
    explicit source_handle(S source)
        : _self(std::make_shared<model<S>>(std::make_shared<const S>(std::move(source)))) {}

    template<connection_source S>
    explicit source_handle(std::shared_ptr<const S> source)
        : _self(std::make_shared<model<S>>(std::move(source))) {}

    auto probe(
        const std::string& ip,
        const std::string& port,
        const std::string& protocol,
        const probe_options& options
    ) const -> std::optional<probe_result> {
        return _self->probe(ip, port, protocol, options);
    }

    auto source_name() const -> std::string { return _self->source_name(); }
    auto source_ips() const -> std::vector<std::string> { return _self->source_ips(); }

private:
    struct source_concept {
        virtual ~source_concept() = default;
        virtual auto probe(const std::string&, const std::string&, const std::string&,
                           const probe_options&) const -> std::optional<probe_result> = 0;
        virtual auto source_name() const -> std::string = 0;
        virtual auto source_ips() const -> std::vector<std::string> = 0;
    };

    template<typename S>
    struct model final : source_concept {
        explicit model(std::shared_ptr<const S> source) : _source(std::move(source)) {}

        auto probe(const std::string& ip, const std::string& port, const std::string& protocol,
                   const probe_options& options) const -> std::optional<probe_result> override {
            return _source->probe(ip, port, protocol, options);
        }
        auto source_name() const -> std::string override { return _source->source_name(); }
        auto source_ips() const -> std::vector<std::string> override {
            return _source->source_ips();
        }

        std::shared_ptr<const S> _source;
    };

    std::shared_ptr<const source_concept> _self;
};

static_assert(connection_source<source_handle>, "source_handle must satisfy connection_source");

/**
 * @brief One-shot reachability check with no expectation recording
 *
 * Probes once with the default options and the target's protocol (TCP when
 * the target does not override it).
 */
template<connection_source S, connection_target T>
auto have_connectivity_to(
    const S& source,
    const T& target,
    std::optional<port_number> explicit_port = std::nullopt
) -> bool {
    auto matcher = target.to_matcher(explicit_port);
    return source.probe(matcher.ip, matcher.port,
                        matcher.effective_protocol(protocol_tcp), probe_options{}).has_value();
}

// Diagnostics for have_connectivity_to
inline auto failure_message(const std::string& source_name, const target_matcher& matcher) -> std::string {
    return "Expected " + source_name + "\nto have connectivity to " + matcher.target_name +
           "\n\t" + matcher.ip + ":" + matcher.port + "\nbut it does not";
}

inline auto negated_failure_message(const std::string& source_name, const target_matcher& matcher) -> std::string {
    return "Expected " + source_name + "\nnot to have connectivity to " + matcher.target_name +
           "\n\t" + matcher.ip + ":" + matcher.port + "\nbut it does";
}

} // namespace reachability
