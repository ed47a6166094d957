#include <textexpander/rule_set.h>
#include <textexpander/engine.h>
#include <algorithm>

namespace textexpander {

TriggerIndex::TriggerIndex()
    : forward_(1)
    , reverse_(1)
    , count_(0)
    , maxLength_(0) {
}

int TriggerIndex::child(const std::vector<Node>& trie, int node, char32_t ch) {
    if (node == kNoNode) {
        return kNoNode;
    }
    const auto& children = trie[static_cast<size_t>(node)].children;
    auto it = children.find(ch);
    return it == children.end() ? kNoNode : it->second;
}

int TriggerIndex::addChild(std::vector<Node>& trie, int node, char32_t ch) {
    int existing = child(trie, node, ch);
    if (existing != kNoNode) {
        return existing;
    }
    // Index, not reference: push_back may reallocate
    int created = static_cast<int>(trie.size());
    trie.emplace_back();
    trie[static_cast<size_t>(node)].children[ch] = created;
    return created;
}

bool TriggerIndex::insert(const std::u32string& trigger, int entry) {
    if (trigger.empty()) {
        return false;
    }

    if (entryAt(nodeFor(trigger)) != kNoEntry) {
        return false;
    }

    int node = root();
    for (char32_t ch : trigger) {
        node = addChild(forward_, node, ch);
    }
    forward_[static_cast<size_t>(node)].entry = entry;

    node = 0;
    for (auto it = trigger.rbegin(); it != trigger.rend(); ++it) {
        node = addChild(reverse_, node, *it);
    }
    reverse_[static_cast<size_t>(node)].entry = entry;

    count_++;
    maxLength_ = std::max(maxLength_, trigger.size());
    return true;
}

int TriggerIndex::longestSuffix(const MatchState& buffer) const {
    int best = kNoEntry;
    int node = 0;

    for (size_t offset = 0; offset < buffer.size(); ++offset) {
        node = child(reverse_, node, buffer.fromEnd(offset));
        if (node == kNoNode) {
            break;
        }
        // Deeper terminals are longer triggers
        if (reverse_[static_cast<size_t>(node)].entry != kNoEntry) {
            best = reverse_[static_cast<size_t>(node)].entry;
        }
    }

    return best;
}

int TriggerIndex::advance(int node, char32_t ch) const {
    return child(forward_, node, ch);
}

int TriggerIndex::walk(int node, const std::u32string& text) const {
    for (char32_t ch : text) {
        node = advance(node, ch);
        if (node == kNoNode) {
            break;
        }
    }
    return node;
}

int TriggerIndex::entryAt(int node) const {
    if (node == kNoNode) {
        return kNoEntry;
    }
    return forward_[static_cast<size_t>(node)].entry;
}

bool TriggerIndex::hasContinuation(int node) const {
    if (node == kNoNode) {
        return false;
    }
    return !forward_[static_cast<size_t>(node)].children.empty();
}

int TriggerIndex::nodeFor(const std::u32string& trigger) const {
    return walk(root(), trigger);
}

} // namespace textexpander
