#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace ember {

// Non-owning reference to a callable. The referenced callable must outlive the
// view, so views are only passed down the stack, never stored.
template <typename Fn>
struct FunctionView {};

template <typename R, typename... Args>
struct FunctionView<R(Args...)> {
    template <typename Fn,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, FunctionView>>>
    FunctionView(Fn&& fn)
        : m_callable{const_cast<void*>(static_cast<const void*>(std::addressof(fn)))},
          m_fn{[](void* callable, Args&&... args) -> R {
              return (*static_cast<std::remove_reference_t<Fn>*>(callable))(
                  std::forward<Args>(args)...);
          }} {}

    template <typename... CallArgs>
    R operator()(CallArgs&&... args) const {
        return m_fn(m_callable, std::forward<CallArgs>(args)...);
    }

private:
    void* m_callable = nullptr;
    R (*m_fn)(void*, Args&&...) = nullptr;
};

}  // namespace ember
