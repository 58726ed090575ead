#pragma once

#include <memory>
#include <utility>

namespace BjornManager {

// Owning pointer to an implementation struct that is only complete in the .cpp.
// The owning class must declare its destructor in the header and define it in the
// .cpp, after Impl is complete.
template <typename Impl>
class Pimpl {
public:
    template <typename... Args>
    Pimpl(Args&&... args) : impl_(std::make_unique<Impl>(std::forward<Args>(args)...))
    {}

    Pimpl(const Pimpl&) = delete;
    Pimpl& operator=(const Pimpl&) = delete;
    Pimpl(Pimpl&&) noexcept = default;
    Pimpl& operator=(Pimpl&&) noexcept = default;
    ~Pimpl() = default;

    Impl* operator->() { return impl_.get(); }
    const Impl* operator->() const { return impl_.get(); }
    Impl& operator*() { return *impl_; }
    const Impl& operator*() const { return *impl_; }

private:
    std::unique_ptr<Impl> impl_;
};

} // namespace BjornManager
