#ifndef ORDMAP_TREE_NODE_HPP
#define ORDMAP_TREE_NODE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace ordmap {

template <typename K, typename V>
class TreeNode;

// NodePtr - owning handle to a TreeNode.
// Copying adds a reference, destruction releases one; the node deletes
// itself when the last handle goes away.
template <typename K, typename V>
class NodePtr {
public:
    using Node = TreeNode<K, V>;

    NodePtr() noexcept : node_(nullptr) {}
    NodePtr(std::nullptr_t) noexcept : node_(nullptr) {}

    // Takes a reference on node. Freshly allocated nodes start at refcount 0.
    explicit NodePtr(const Node* node) noexcept : node_(node) {
        if (node_) node_->addRef();
    }

    NodePtr(const NodePtr& other) noexcept : node_(other.node_) {
        if (node_) node_->addRef();
    }

    NodePtr(NodePtr&& other) noexcept : node_(other.node_) {
        other.node_ = nullptr;
    }

    ~NodePtr() {
        if (node_) node_->release();
    }

    NodePtr& operator=(const NodePtr& other) noexcept {
        if (this != &other) {
            if (other.node_) other.node_->addRef();
            if (node_) node_->release();
            node_ = other.node_;
        }
        return *this;
    }

    NodePtr& operator=(NodePtr&& other) noexcept {
        if (this != &other) {
            if (node_) node_->release();
            node_ = other.node_;
            other.node_ = nullptr;
        }
        return *this;
    }

    const Node* get() const noexcept { return node_; }
    const Node* operator->() const noexcept { return node_; }
    const Node& operator*() const noexcept { return *node_; }
    explicit operator bool() const noexcept { return node_ != nullptr; }

    // Physical identity, not structural equality.
    friend bool operator==(const NodePtr& a, const NodePtr& b) noexcept { return a.node_ == b.node_; }
    friend bool operator!=(const NodePtr& a, const NodePtr& b) noexcept { return a.node_ != b.node_; }

private:
    const Node* node_;
};

// TreeNode - height-balanced search tree node with intrusive reference counting.
// A node is never modified after construction; updates allocate new nodes
// along the changed path and share every untouched child.
template <typename K, typename V>
class TreeNode {
public:
    const NodePtr<K, V> left;
    const K key;
    const V value;
    const NodePtr<K, V> right;
    const int height;

    TreeNode(NodePtr<K, V> l, K k, V v, NodePtr<K, V> r, int h)
        : left(std::move(l)), key(std::move(k)), value(std::move(v)), right(std::move(r)),
          height(h), refcount_(0) {}

    TreeNode(const TreeNode&) = delete;
    TreeNode& operator=(const TreeNode&) = delete;

    // Reference counting
    void addRef() const noexcept {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const noexcept {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const noexcept {
        return refcount_.load(std::memory_order_relaxed);
    }

    bool isLeaf() const noexcept { return !left && !right; }

private:
    mutable std::atomic<uint32_t> refcount_;
};

} // namespace ordmap

#endif // ORDMAP_TREE_NODE_HPP
