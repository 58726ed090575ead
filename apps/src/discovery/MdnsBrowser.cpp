#include "discovery/MdnsBrowser.h"
#include "core/LoggingChannels.h"
#include <atomic>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>

namespace BjornManager {
namespace Discovery {

struct MdnsBrowser::Impl {
    std::vector<std::string> serviceTypes_;
    SightingSink* sink_ = nullptr;

    AvahiThreadedPoll* poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    std::vector<AvahiServiceBrowser*> browsers_;
    std::atomic<bool> started_{ false };

    explicit Impl(std::vector<std::string> serviceTypes) : serviceTypes_(std::move(serviceTypes))
    {}

    static void resolveCallback(
        AvahiServiceResolver* resolver,
        AvahiIfIndex /*interface*/,
        AvahiProtocol /*protocol*/,
        AvahiResolverEvent event,
        const char* name,
        const char* type,
        const char* /*domain*/,
        const char* hostName,
        const AvahiAddress* address,
        uint16_t /*port*/,
        AvahiStringList* /*txt*/,
        AvahiLookupResultFlags /*flags*/,
        void* userdata)
    {
        auto* self = static_cast<Impl*>(userdata);

        switch (event) {
            case AVAHI_RESOLVER_FOUND: {
                if (!address || address->proto != AVAHI_PROTO_INET) {
                    break;
                }
                char addressText[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(addressText, sizeof(addressText), address);

                // Prefer the advertised host name; fall back to the instance name.
                std::string host = hostName ? hostName : "";
                if (host.empty() && name) {
                    host = name;
                }
                LOG_DEBUG(Discovery, "mDNS {} '{}' -> {} ({})", type, name, addressText, host);
                if (self->sink_) {
                    self->sink_->onSighting(Sighting{ host, addressText, SourceKind::Mdns });
                }
                break;
            }
            case AVAHI_RESOLVER_FAILURE:
                LOG_DEBUG(
                    Discovery,
                    "mDNS resolve of '{}' ({}) failed: {}",
                    name ? name : "",
                    type ? type : "",
                    avahi_strerror(
                        avahi_client_errno(avahi_service_resolver_get_client(resolver))));
                break;
        }

        avahi_service_resolver_free(resolver);
    }

    static void browseCallback(
        AvahiServiceBrowser* browser,
        AvahiIfIndex interface,
        AvahiProtocol protocol,
        AvahiBrowserEvent event,
        const char* name,
        const char* type,
        const char* domain,
        AvahiLookupResultFlags /*flags*/,
        void* userdata)
    {
        auto* self = static_cast<Impl*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                // The resolver frees itself in resolveCallback.
                AvahiServiceResolver* resolver = avahi_service_resolver_new(
                    self->client_,
                    interface,
                    protocol,
                    name,
                    type,
                    domain,
                    AVAHI_PROTO_INET,
                    static_cast<AvahiLookupFlags>(0),
                    resolveCallback,
                    self);
                if (!resolver) {
                    LOG_WARN(
                        Discovery,
                        "mDNS: cannot resolve '{}': {}",
                        name,
                        avahi_strerror(avahi_client_errno(self->client_)));
                }
                break;
            }
            case AVAHI_BROWSER_FAILURE:
                LOG_ERROR(
                    Discovery,
                    "mDNS browser failure: {}",
                    avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(browser))));
                break;
            case AVAHI_BROWSER_REMOVE:
                // Removal is handled by the stale sweep, not by mDNS goodbyes.
                LOG_TRACE(Discovery, "mDNS {} '{}' withdrawn", type, name);
                break;
            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void clientCallback(AvahiClient* client, AvahiClientState state, void* /*userdata*/)
    {
        switch (state) {
            case AVAHI_CLIENT_FAILURE:
                LOG_ERROR(
                    Discovery,
                    "mDNS: Avahi client failure: {}",
                    avahi_strerror(avahi_client_errno(client)));
                break;
            case AVAHI_CLIENT_S_RUNNING:
                LOG_DEBUG(Discovery, "mDNS: Avahi daemon running");
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    VoidOutcome startAvahi()
    {
        poll_ = avahi_threaded_poll_new();
        if (!poll_) {
            return failVoid(ErrorKind::Discovery, "Failed to create Avahi threaded poll");
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(poll_),
            static_cast<AvahiClientFlags>(0),
            clientCallback,
            this,
            &error);
        if (!client_) {
            const std::string message =
                std::string("Failed to create Avahi client: ") + avahi_strerror(error);
            avahi_threaded_poll_free(poll_);
            poll_ = nullptr;
            return failVoid(ErrorKind::Discovery, message);
        }

        for (const auto& serviceType : serviceTypes_) {
            AvahiServiceBrowser* browser = avahi_service_browser_new(
                client_,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_INET,
                serviceType.c_str(),
                nullptr,
                static_cast<AvahiLookupFlags>(0),
                browseCallback,
                this);
            if (!browser) {
                LOG_WARN(
                    Discovery,
                    "mDNS: cannot browse {}: {}",
                    serviceType,
                    avahi_strerror(avahi_client_errno(client_)));
                continue;
            }
            browsers_.push_back(browser);
        }

        if (browsers_.empty()) {
            stopAvahi();
            return failVoid(ErrorKind::Discovery, "No mDNS service browser could be created");
        }

        if (avahi_threaded_poll_start(poll_) < 0) {
            stopAvahi();
            return failVoid(ErrorKind::Discovery, "Failed to start Avahi threaded poll");
        }
        return okayVoid();
    }

    void stopAvahi()
    {
        if (poll_) {
            avahi_threaded_poll_stop(poll_);
        }
        for (auto* browser : browsers_) {
            avahi_service_browser_free(browser);
        }
        browsers_.clear();
        if (client_) {
            avahi_client_free(client_);
            client_ = nullptr;
        }
        if (poll_) {
            avahi_threaded_poll_free(poll_);
            poll_ = nullptr;
        }
    }
};

MdnsBrowser::MdnsBrowser(std::vector<std::string> serviceTypes) : pImpl_(std::move(serviceTypes))
{}

MdnsBrowser::~MdnsBrowser()
{
    stop();
}

VoidOutcome MdnsBrowser::start(SightingSink& sink)
{
    if (pImpl_->started_.load()) {
        return okayVoid();
    }
    if (pImpl_->serviceTypes_.empty()) {
        return failVoid(ErrorKind::Discovery, "No mDNS service types configured");
    }

    pImpl_->sink_ = &sink;
    auto result = pImpl_->startAvahi();
    if (result.isError()) {
        pImpl_->sink_ = nullptr;
        return result;
    }

    pImpl_->started_.store(true);
    LOG_INFO(Discovery, "mDNS browsing {} service type(s)", pImpl_->browsers_.size());
    return okayVoid();
}

void MdnsBrowser::stop()
{
    pImpl_->started_.store(false);
    pImpl_->stopAvahi();
    pImpl_->sink_ = nullptr;
}

bool MdnsBrowser::isRunning() const
{
    return pImpl_->started_.load();
}

} // namespace Discovery
} // namespace BjornManager
