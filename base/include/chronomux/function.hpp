/**
 * @file function.hpp
 * @brief Type-erased callable with fixed inline storage
 *
 * Continuations in the service (parked wait replies, IRQ acknowledge hooks,
 * client entry points) are stored in statically sized tables, so the callable
 * wrapper never touches the heap. A callable that does not fit the inline
 * buffer is a compile error.
 */

#ifndef CHRONOMUX_FUNCTION_HPP
#define CHRONOMUX_FUNCTION_HPP

#include <array>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace chronomux
{

template<typename Signature, std::size_t InlineSize = 32>
class Function;

/**
 * @brief Move-only callable, similar to std::function without allocation
 *
 * @tparam Ret        Return type
 * @tparam Args       Argument types
 * @tparam InlineSize Size of inline storage buffer in bytes
 *
 * Example:
 *   Function<void(TimerMask), 32> on_fire = [&seen](TimerMask m) { seen |= m; };
 */
template<typename Ret, typename... Args, std::size_t InlineSize>
class Function<Ret(Args...), InlineSize>
{
   using InvokeFn  = Ret(*)(void*, Args&&...);
   using MoveFn    = void(*)(void*, void*);
   using DestroyFn = void(*)(void*);

   struct VTable
   {
      InvokeFn  invoke;
      MoveFn    move;
      DestroyFn destroy;
   };

   VTable const* vtable{nullptr};

   alignas(std::max_align_t) std::array<std::byte, InlineSize> storage{};

public:
   static constexpr std::size_t inline_size = InlineSize;

   constexpr Function() = default;
   constexpr Function(std::nullptr_t) noexcept {}

   template<typename F>
      requires (!std::is_same_v<std::decay_t<F>, Function> && !std::is_same_v<std::decay_t<F>, std::nullptr_t>)
   Function(F&& f)
   {
      emplace(std::forward<F>(f));
   }

   ~Function()
   {
      reset();
   }

   Function(Function&& other) noexcept
   {
      move_from(std::move(other));
   }

   Function& operator=(Function&& other) noexcept
   {
      if (this != &other) {
         reset();
         move_from(std::move(other));
      }
      return *this;
   }

   Function& operator=(std::nullptr_t) noexcept
   {
      reset();
      return *this;
   }

   Function(Function const&) = delete;
   Function& operator=(Function const&) = delete;

   /**
    * @brief Replace current callable with a new one
    */
   template<typename F>
   void emplace(F&& f)
   {
      using Decayed = std::decay_t<F>;

      static_assert(std::is_invocable_r_v<Ret, Decayed&, Args...>,
                    "Callable signature does not match Function signature");
      static_assert(sizeof(Decayed) <= InlineSize,
                    "Callable too large for inline storage. Increase InlineSize.");
      static_assert(alignof(Decayed) <= alignof(std::max_align_t),
                    "Callable is over-aligned for inline storage");
      static_assert(std::is_nothrow_move_constructible_v<Decayed>,
                    "Callable must be nothrow move constructible");

      reset();
      ::new (static_cast<void*>(storage.data())) Decayed(std::forward<F>(f));
      vtable = &VTableImpl<Decayed>::table;
   }

   /**
    * @brief Invoke the stored callable
    *
    * operator() is const because it does not change which callable is stored,
    * the callable itself may still mutate its captures.
    */
   Ret operator()(Args... args) const
   {
      return vtable->invoke(const_cast<Function*>(this), std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept
   {
      return vtable != nullptr;
   }

   void reset() noexcept
   {
      if (vtable) {
         vtable->destroy(this);
         vtable = nullptr;
      }
   }

private:
   template<typename F>
   struct VTableImpl
   {
      static Ret invoke(void* self_void, Args&&... args)
      {
         return (*get(static_cast<Function*>(self_void)))(std::forward<Args>(args)...);
      }

      static void move(void* dst_void, void* src_void)
      {
         auto* dst = static_cast<Function*>(dst_void);
         auto* src = static_cast<Function*>(src_void);

         F* src_obj = get(src);
         ::new (static_cast<void*>(dst->storage.data())) F(std::move(*src_obj));
         src_obj->~F();

         dst->vtable = src->vtable;
         src->vtable = nullptr;
      }

      static void destroy(void* self_void)
      {
         get(static_cast<Function*>(self_void))->~F();
      }

      static F* get(Function* self)
      {
         return std::launder(reinterpret_cast<F*>(self->storage.data()));
      }

      static constexpr VTable table{
         .invoke  = &VTableImpl::invoke,
         .move    = &VTableImpl::move,
         .destroy = &VTableImpl::destroy
      };
   };

   void move_from(Function&& other) noexcept
   {
      if (!other.vtable) {
         vtable = nullptr;
         return;
      }
      other.vtable->move(this, &other);
   }
};

} // namespace chronomux

#endif // CHRONOMUX_FUNCTION_HPP
