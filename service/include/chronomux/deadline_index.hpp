/**
 * @file deadline_index.hpp
 * @brief Fixed-capacity intrusive binary min-heap
 *
 * The global deadline index orders every armed virtual timer of every client.
 * Nodes carry their own heap position (Traits::index) so an arbitrary timer
 * can be removed in O(log n) on cancel, without searching.
 *
 * Traits requirements:
 *   using Node = ...;
 *   static constexpr uint16_t CAPACITY;
 *   static uint16_t& index(Node*);
 *   static bool earlier(Node const*, Node const*);   // strict weak ordering
 */

#ifndef CHRONOMUX_DEADLINE_INDEX_HPP
#define CHRONOMUX_DEADLINE_INDEX_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

namespace chronomux
{

template<typename Traits>
class IntrusiveMinHeap
{
public:
   using Node      = typename Traits::Node;
   using IndexType = uint16_t;

   static constexpr IndexType NOT_IN_HEAP = std::numeric_limits<IndexType>::max();
   static constexpr IndexType CAPACITY    = Traits::CAPACITY;
   static_assert(CAPACITY < NOT_IN_HEAP, "Heap capacity collides with the NOT_IN_HEAP marker");

private:
   std::array<Node*, CAPACITY> heap_buffer{};
   IndexType size_count{0};

   static IndexType parent(IndexType i) noexcept { return (i - 1u) >> 1; }
   static IndexType left  (IndexType i) noexcept { return (i << 1) + 1u; }
   static IndexType right (IndexType i) noexcept { return (i << 1) + 2u; }

   static bool earlier(Node const* a, Node const* b) noexcept { return Traits::earlier(a, b); }

   static IndexType& index(Node* n) noexcept { return Traits::index(n); }

   void swap_nodes(IndexType a, IndexType b) noexcept
   {
      std::swap(heap_buffer[a], heap_buffer[b]);
      index(heap_buffer[a]) = a;
      index(heap_buffer[b]) = b;
   }

   void sift_up(IndexType i) noexcept
   {
      while (i > 0) {
         IndexType p = parent(i);
         if (!earlier(heap_buffer[i], heap_buffer[p])) break;
         swap_nodes(i, p);
         i = p;
      }
   }

   void sift_down(IndexType i) noexcept
   {
      while (true) {
         IndexType l = left(i), r = right(i), m = i;
         if (l < size_count && earlier(heap_buffer[l], heap_buffer[m])) m = l;
         if (r < size_count && earlier(heap_buffer[r], heap_buffer[m])) m = r;
         if (m == i) break;
         swap_nodes(i, m);
         i = m;
      }
   }

public:
   [[nodiscard]] bool empty() const noexcept { return size_count == 0; }
   [[nodiscard]] bool full()  const noexcept { return size_count == CAPACITY; }
   [[nodiscard]] IndexType size() const noexcept { return size_count; }
   [[nodiscard]] Node* top() const noexcept { return size_count ? heap_buffer[0] : nullptr; }

   [[nodiscard]] static bool contains(Node* n) noexcept { return index(n) != NOT_IN_HEAP; }

   /**
    * @brief Insert a node
    * @return false if the heap is full or the node is already linked
    */
   [[nodiscard]] bool push(Node* n) noexcept
   {
      if (full() || contains(n)) return false;
      IndexType i = size_count++;
      heap_buffer[i] = n;
      index(n) = i;
      sift_up(i);
      return true;
   }

   Node* pop_min() noexcept
   {
      if (!size_count) return nullptr;
      Node* n = heap_buffer[0];
      index(n) = NOT_IN_HEAP;
      --size_count;
      if (size_count) {
         heap_buffer[0] = heap_buffer[size_count];
         index(heap_buffer[0]) = 0;
         sift_down(0);
      }
      return n;
   }

   /**
    * @brief Unlink a node from anywhere in the heap (no-op if not linked)
    */
   void remove(Node* n) noexcept
   {
      IndexType i = index(n);
      if (i == NOT_IN_HEAP) return;

      index(n) = NOT_IN_HEAP;
      --size_count;
      if (i == size_count) return; // removed last

      heap_buffer[i] = heap_buffer[size_count];
      index(heap_buffer[i]) = i;

      // Re-heapify from i (either direction)
      if (i > 0 && earlier(heap_buffer[i], heap_buffer[parent(i)])) {
         sift_up(i);
      } else {
         sift_down(i);
      }
   }

   /**
    * @brief Visit every linked node in storage (not deadline) order
    */
   template<typename Fn>
   void for_each(Fn&& fn) const
   {
      for (IndexType i = 0; i < size_count; ++i) {
         fn(heap_buffer[i]);
      }
   }

   /**
    * @brief Check the heap property and the stored back-indices
    */
   [[nodiscard]] bool valid() const noexcept
   {
      for (IndexType i = 0; i < size_count; ++i) {
         if (index(heap_buffer[i]) != i) return false;
         if (i > 0 && earlier(heap_buffer[i], heap_buffer[parent(i)])) return false;
      }
      return true;
   }
};

} // namespace chronomux

#endif // CHRONOMUX_DEADLINE_INDEX_HPP
