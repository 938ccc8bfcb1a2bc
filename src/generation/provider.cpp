#include "generation/provider.hpp"

#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace ragquery {

ProviderCall::ProviderCall(CancelToken cancel,
                           SteadyClock::time_point first_token_deadline,
                           SteadyClock::time_point total_deadline,
                           DeltaSink sink)
    : cancel_(std::move(cancel)),
      first_token_deadline_(first_token_deadline),
      total_deadline_(total_deadline),
      sink_(std::move(sink)) {}

bool ProviderCall::deadline_passed() const noexcept {
    const auto now = SteadyClock::now();
    if (now >= total_deadline_) {
        return true;
    }
    return !emitted() && now >= first_token_deadline_;
}

void ProviderCall::check_deadline() const {
    const auto now = SteadyClock::now();
    if (now >= total_deadline_) {
        throw ProviderError("total generation timeout exceeded", true);
    }
    if (!emitted() && now >= first_token_deadline_) {
        throw ProviderError("no first token before timeout", true);
    }
}

std::chrono::milliseconds ProviderCall::remaining() const noexcept {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(total_deadline_ - SteadyClock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

bool ProviderCall::emit(std::string_view delta) {
    if (cancelled()) {
        return false;
    }
    check_deadline();
    if (delta.empty()) {
        return true;
    }
    text_.append(delta);
    if (sink_) {
        sink_(delta);
    }
    return true;
}

CallbackProvider::CallbackProvider(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("callback provider requires a function");
    }
}

void CallbackProvider::stream(const ProviderRequest& request, ProviderCall& call) const {
    try {
        fn_(request, call);
    } catch (const ProviderError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ProviderError(name_ + " failed: " + ex.what());
    }
    if (!call.cancelled()) {
        call.check_deadline();
    }
}

const std::string& provider_name(const Provider& provider) {
    return std::visit([](const auto& p) -> const std::string& { return p.name(); }, provider);
}

void stream_provider(const Provider& provider, const ProviderRequest& request, ProviderCall& call) {
    std::visit([&](const auto& p) { p.stream(request, call); }, provider);
}

}  // namespace ragquery
