#pragma once
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemaver {

/**
 * Order
 *  - natural key (source rank, group rank, sequence rank), assigned by the
 *    parser from the declaration position
 *  - occurs_before / occurs_after: abstract labels this order must precede
 *    or follow. Labels keep only alphanumerics and '.', lower cased.
 *
 * Comparison operators only look at the natural key; the labels are only
 * honoured by full_sort().
 */
class Order {
public:
    // label -> index of the Order (in the sorted input) known under that label
    using LabelMap = std::unordered_map<std::string, std::size_t>;

    Order() = default;
    Order(int source, int group, int sequence,
          const std::vector<std::string>& before = {},
          const std::vector<std::string>& after = {});

    // Throws OrderError unless items holds exactly 3 values.
    static Order from_items(const std::vector<int>& items,
                            const std::vector<std::string>& before = {},
                            const std::vector<std::string>& after = {});

    const std::array<int, 3>& items() const { return order_; }
    const std::vector<std::string>& occurs_before() const { return before_; }
    const std::vector<std::string>& occurs_after() const { return after_; }

    // negative, zero or positive, like strcmp
    int compare(const Order& other) const;

    bool operator<(const Order& o) const { return compare(o) < 0; }
    bool operator<=(const Order& o) const { return compare(o) <= 0; }
    bool operator>(const Order& o) const { return compare(o) > 0; }
    bool operator>=(const Order& o) const { return compare(o) >= 0; }

    std::string str() const;

    // Returns the cleaned label, or an empty string when nothing is left.
    static std::string clean_label(const std::string& label);

    /**
     * @brief Sorts the orders by their natural key, with the additional
     * constraints of the before/after labels.
     *
     * Labels found in @p labels (keys are cleaned like any other label)
     * resolve to the Order at that index; every
     * other label becomes a placeholder node that is dropped from the
     * result. Throws CyclicDependencyError when the constraints loop.
     */
    static std::vector<Order> full_sort(const std::vector<Order>& orders, const LabelMap& labels = {});

    // Same as full_sort(), but returns the positions into @p orders.
    static std::vector<std::size_t> sort_indices(const std::vector<const Order*>& orders,
                                                 const LabelMap& labels = {});

private:
    std::array<int, 3> order_ {0, 0, 0};
    std::vector<std::string> before_;
    std::vector<std::string> after_;
};

} // namespace schemaver
