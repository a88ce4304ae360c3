#pragma once

#include <bit>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <new>
#include <utility>

namespace pathmux {

// Append-only arena of objects of type T.
// Once constructed, objects never move: their addresses remain valid until the pool is reset or destroyed.
// Objects cannot be released individually, they are all destroyed together (in reverse order of block allocation).
template <class T>
class ObjectPool {
 public:
  static constexpr std::size_t kDefaultInitialCapacity = 16U;
  static constexpr std::size_t kGrowthFactor = 2U;

  using size_type = std::size_t;

  // Creates an empty ObjectPool with no preallocated capacity.
  // At the first allocation, a block of default initial capacity will be allocated.
  ObjectPool() noexcept = default;

  // Creates an empty ObjectPool whose first block will hold initialCapacity objects (rounded up to the next power of
  // two). Each subsequent block doubles the capacity of the previous one.
  explicit ObjectPool(size_type initialCapacity)
      : _nextBlockCapacity(std::bit_ceil(initialCapacity == 0 ? size_type{1} : initialCapacity)) {}

  ObjectPool(const ObjectPool &) = delete;
  ObjectPool &operator=(const ObjectPool &) = delete;

  // Move operations transfer ownership of all objects, no pointer is invalidated.
  ObjectPool(ObjectPool &&other) noexcept
      : _lastBlock(std::exchange(other._lastBlock, nullptr)),
        _nextBlockCapacity(std::exchange(other._nextBlockCapacity, kDefaultInitialCapacity)),
        _totalCapacity(std::exchange(other._totalCapacity, 0)),
        _size(std::exchange(other._size, 0)) {}

  ObjectPool &operator=(ObjectPool &&other) noexcept {
    if (this != &other) {
      reset();
      _lastBlock = std::exchange(other._lastBlock, nullptr);
      _nextBlockCapacity = std::exchange(other._nextBlockCapacity, kDefaultInitialCapacity);
      _totalCapacity = std::exchange(other._totalCapacity, 0);
      _size = std::exchange(other._size, 0);
    }
    return *this;
  }

  ~ObjectPool() { reset(); }

  // Constructs a new object in the pool and returns a pointer to it.
  // If the constructor of T throws, the pool is left unchanged (apart from a possibly newly allocated block).
  template <class... Args>
  [[nodiscard]] T *allocateAndConstruct(Args &&...args) {
    if (_lastBlock == nullptr || _lastBlock->_size == _lastBlock->_capacity) {
      addBlock();
    }
    T *obj = std::construct_at(objectBegin(_lastBlock) + _lastBlock->_size, std::forward<Args>(args)...);
    ++_lastBlock->_size;
    ++_size;
    return obj;
  }

  // Returns the number of object slots currently allocated.
  [[nodiscard]] size_type capacity() const noexcept { return _totalCapacity; }

  // Returns the number of live objects.
  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0U; }

  // Destroys all objects and releases all blocks.
  // All pointers previously returned by allocateAndConstruct become invalid.
  void reset() noexcept {
    while (_lastBlock != nullptr) {
      Block *prevBlock = _lastBlock->_prevBlock;
      std::destroy_n(std::launder(objectBegin(_lastBlock)), _lastBlock->_size);
      _nextBlockCapacity = _lastBlock->_capacity;
      std::free(_lastBlock);
      _lastBlock = prevBlock;
    }
    _totalCapacity = 0;
    _size = 0;
  }

 private:
  static_assert(alignof(T) <= alignof(std::max_align_t), "over-aligned types are not supported");

  struct Block {
    Block *_prevBlock;
    size_type _capacity;
    size_type _size;
  };

  // The object array follows the Block header, padded so that it is correctly aligned for T.
  static constexpr size_type kPadding = (alignof(T) - (sizeof(Block) % alignof(T))) % alignof(T);

  static T *objectBegin(Block *block) noexcept {
    return reinterpret_cast<T *>(reinterpret_cast<std::byte *>(block + 1) + kPadding);
  }

  void addBlock() {
    const size_type blockCapacity = _lastBlock == nullptr ? _nextBlockCapacity : _lastBlock->_capacity * kGrowthFactor;

    auto *newBlock = static_cast<Block *>(std::malloc(sizeof(Block) + kPadding + (blockCapacity * sizeof(T))));
    if (newBlock == nullptr) {
      throw std::bad_alloc();
    }

    newBlock->_prevBlock = _lastBlock;
    newBlock->_capacity = blockCapacity;
    newBlock->_size = 0;

    _lastBlock = newBlock;
    _totalCapacity += blockCapacity;
  }

  Block *_lastBlock{nullptr};
  // Capacity of the first block to be allocated, when no block is allocated.
  size_type _nextBlockCapacity{kDefaultInitialCapacity};
  size_type _totalCapacity{0};
  size_type _size{0};
};

}  // namespace pathmux
