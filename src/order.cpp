#include "schemaver/order.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include "schemaver/lib.hpp"

namespace schemaver {

namespace {

    std::vector<std::string> clean_labels(const std::vector<std::string>& labels) {
        std::vector<std::string> ret;
        for (const auto& label : labels) {
            std::string cleaned = Order::clean_label(label);
            if (!cleaned.empty()) ret.push_back(cleaned);
        }
        return ret;
    }

    // Depth first topological sort over Orders plus label placeholders.
    // Node ids [0, n) are the orders, [n, ...) the placeholder labels.
    class OrderGraph {
    public:
        OrderGraph(const std::vector<const Order*>& orders, const Order::LabelMap& labels)
            : orders_(orders) {
            for (const auto& kv : labels) {
                std::string cleaned = Order::clean_label(kv.first);
                if (!cleaned.empty()) aliases_.emplace(cleaned, kv.second);
            }
            preds_.resize(orders_.size());
            for (std::size_t i = 0; i < orders_.size(); ++i) {
                // after: label -> order
                for (const auto& label : orders_[i]->occurs_after()) {
                    add_edge(node(label), i);
                }
                // before: order -> label
                for (const auto& label : orders_[i]->occurs_before()) {
                    add_edge(i, node(label));
                }
            }
        }

        std::vector<std::size_t> sort() {
            std::vector<std::size_t> all(preds_.size());
            for (std::size_t i = 0; i < all.size(); ++i) all[i] = i;
            // the natural pre-sort urges the search to keep declaration order
            std::stable_sort(all.begin(), all.end(), [this](std::size_t a, std::size_t b) { return less(a, b); });
            for (auto& deps : preds_) {
                std::stable_sort(deps.begin(), deps.end(), [this](std::size_t a, std::size_t b) { return less(a, b); });
            }

            state_.assign(preds_.size(), State::Unvisited);
            for (std::size_t n : all) {
                if (state_[n] == State::Unvisited) visit(n);
            }

            std::vector<std::size_t> ret;
            for (std::size_t n : sorted_) {
                if (n < orders_.size()) ret.push_back(n);
            }
            return ret;
        }

    private:
        enum class State { Unvisited, Visiting, Done };

        std::size_t node(const std::string& label) {
            auto alias = aliases_.find(label);
            if (alias != aliases_.end() && alias->second < orders_.size()) return alias->second;
            auto it = placeholders_.find(label);
            if (it != placeholders_.end()) return it->second;
            std::size_t id = preds_.size();
            preds_.emplace_back();
            names_.push_back(label);
            placeholders_.emplace(label, id);
            return id;
        }

        void add_edge(std::size_t from, std::size_t to) {
            auto& deps = preds_[to];
            if (std::find(deps.begin(), deps.end(), from) == deps.end()) deps.push_back(from);
        }

        const std::string& label_of(std::size_t n) const { return names_[n - orders_.size()]; }

        // Orders by natural key, labels lexicographically, orders before labels.
        bool less(std::size_t a, std::size_t b) const {
            bool a_order = a < orders_.size();
            bool b_order = b < orders_.size();
            if (a_order && b_order) {
                int diff = orders_[a]->compare(*orders_[b]);
                return diff != 0 ? diff < 0 : a < b;
            }
            if (a_order != b_order) return a_order;
            return label_of(a) < label_of(b);
        }

        std::string describe(std::size_t n) const {
            return n < orders_.size() ? orders_[n]->str() : "'" + label_of(n) + "'";
        }

        void visit(std::size_t n) {
            state_[n] = State::Visiting;
            for (std::size_t dep : preds_[n]) {
                if (state_[dep] == State::Unvisited) {
                    visit(dep);
                } else if (state_[dep] == State::Visiting) {
                    SCHEMAVER_THROW(CyclicDependencyError, "cyclic dependency in orders between %s and %s",
                        describe(dep).c_str(), describe(n).c_str());
                }
            }
            state_[n] = State::Done;
            sorted_.push_back(n);
        }

        const std::vector<const Order*>& orders_;
        Order::LabelMap aliases_;
        std::vector<std::vector<std::size_t>> preds_; // node -> nodes that must come first
        std::vector<std::string> names_;              // placeholder labels
        std::unordered_map<std::string, std::size_t> placeholders_;
        std::vector<State> state_;
        std::vector<std::size_t> sorted_;
    };

} // namespace

Order::Order(int source, int group, int sequence,
             const std::vector<std::string>& before,
             const std::vector<std::string>& after)
    : order_ {source, group, sequence}
    , before_(clean_labels(before))
    , after_(clean_labels(after)) {}

Order Order::from_items(const std::vector<int>& items,
                        const std::vector<std::string>& before,
                        const std::vector<std::string>& after) {
    if (items.size() != 3) {
        SCHEMAVER_THROW(OrderError, "order must be of length 3, but found %zu", items.size());
    }
    return Order(items[0], items[1], items[2], before, after);
}

int Order::compare(const Order& other) const {
    for (std::size_t i = 0; i < order_.size(); ++i) {
        if (order_[i] != other.order_[i]) return order_[i] < other.order_[i] ? -1 : 1;
    }
    return 0;
}

std::string Order::str() const {
    std::ostringstream out;
    out << "(" << order_[0] << ", " << order_[1] << ", " << order_[2] << ")";
    return out.str();
}

std::string Order::clean_label(const std::string& label) {
    std::string ret;
    ret.reserve(label.size());
    for (char c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.') ret += static_cast<char>(std::tolower(uc));
    }
    return ret;
}

std::vector<std::size_t> Order::sort_indices(const std::vector<const Order*>& orders, const LabelMap& labels) {
    OrderGraph graph(orders, labels);
    return graph.sort();
}

std::vector<Order> Order::full_sort(const std::vector<Order>& orders, const LabelMap& labels) {
    std::vector<const Order*> ptrs;
    ptrs.reserve(orders.size());
    for (const auto& o : orders) ptrs.push_back(&o);

    std::vector<Order> ret;
    ret.reserve(orders.size());
    for (std::size_t idx : sort_indices(ptrs, labels)) ret.push_back(orders[idx]);
    return ret;
}

} // namespace schemaver
