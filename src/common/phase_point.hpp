#ifndef ODIN_COMMON_PHASE_POINT_HPP
#define ODIN_COMMON_PHASE_POINT_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "errors.hpp"

namespace Odin {
    using Time = double;

    // Tree of tensors. A node is either a leaf holding one tensor or an ordered list of
    // children. Leaf-wise arithmetic requires both operands to share the same nesting.
    class PhasePoint {
    public:
        using UnaryOp = std::function<torch::Tensor(const torch::Tensor&)>;
        using BinaryOp = std::function<torch::Tensor(const torch::Tensor&, const torch::Tensor&)>;

        PhasePoint() = default;
        PhasePoint(torch::Tensor tensor) : tensor_(std::move(tensor)), leaf_(true) {}
        explicit PhasePoint(std::vector<PhasePoint> children) : children_(std::move(children)) {}

        [[nodiscard]] static PhasePoint list(std::vector<PhasePoint> children)
        {
            return PhasePoint(std::move(children));
        }

        [[nodiscard]] bool is_leaf() const noexcept { return leaf_; }
        [[nodiscard]] std::size_t size() const noexcept { return leaf_ ? 0 : children_.size(); }

        [[nodiscard]] const torch::Tensor& tensor() const
        {
            if (!leaf_) {
                throw ShapeMismatchError("PhasePoint::tensor requested on a list node with "
                                         + std::to_string(children_.size()) + " children.");
            }
            return tensor_;
        }

        [[nodiscard]] const std::vector<PhasePoint>& children() const
        {
            if (leaf_) {
                throw ShapeMismatchError("PhasePoint::children requested on a leaf node.");
            }
            return children_;
        }

        [[nodiscard]] const PhasePoint& operator[](std::size_t index) const
        {
            const auto& nodes = children();
            if (index >= nodes.size()) {
                throw std::out_of_range("PhasePoint child index " + std::to_string(index)
                                        + " out of range for a list of " + std::to_string(nodes.size()) + ".");
            }
            return nodes[index];
        }

        // Depth-first, left to right. This order is the canonical flattening order.
        [[nodiscard]] std::vector<torch::Tensor> leaves() const
        {
            std::vector<torch::Tensor> out;
            collect(out);
            return out;
        }

        [[nodiscard]] std::size_t num_leaves() const
        {
            if (leaf_) {
                return 1;
            }
            std::size_t count = 0;
            for (const auto& child : children_) {
                count += child.num_leaves();
            }
            return count;
        }

        [[nodiscard]] PhasePoint map(const UnaryOp& op) const
        {
            if (leaf_) {
                return PhasePoint(op(tensor_));
            }
            std::vector<PhasePoint> mapped;
            mapped.reserve(children_.size());
            for (const auto& child : children_) {
                mapped.push_back(child.map(op));
            }
            return PhasePoint(std::move(mapped));
        }

        [[nodiscard]] static PhasePoint zip(const PhasePoint& lhs, const PhasePoint& rhs, const BinaryOp& op)
        {
            if (lhs.leaf_ != rhs.leaf_) {
                throw ShapeMismatchError("Cannot combine a leaf with a list node in a phase point operation.");
            }
            if (lhs.leaf_) {
                return PhasePoint(op(lhs.tensor_, rhs.tensor_));
            }
            if (lhs.children_.size() != rhs.children_.size()) {
                throw ShapeMismatchError("Cannot combine phase point lists of length "
                                         + std::to_string(lhs.children_.size()) + " and "
                                         + std::to_string(rhs.children_.size()) + ".");
            }
            std::vector<PhasePoint> combined;
            combined.reserve(lhs.children_.size());
            for (std::size_t i = 0; i < lhs.children_.size(); ++i) {
                combined.push_back(zip(lhs.children_[i], rhs.children_[i], op));
            }
            return PhasePoint(std::move(combined));
        }

    private:
        void collect(std::vector<torch::Tensor>& out) const
        {
            if (leaf_) {
                out.push_back(tensor_);
                return;
            }
            for (const auto& child : children_) {
                child.collect(out);
            }
        }

        torch::Tensor tensor_{};
        std::vector<PhasePoint> children_{};
        bool leaf_{false};
    };

    // Nesting of a phase point together with the sizes and dtype of every leaf.
    struct Structure {
        bool leaf{false};
        std::vector<std::int64_t> sizes{};
        c10::ScalarType dtype{c10::ScalarType::Undefined};
        std::vector<Structure> children{};

        [[nodiscard]] std::size_t num_leaves() const
        {
            if (leaf) {
                return 1;
            }
            std::size_t count = 0;
            for (const auto& child : children) {
                count += child.num_leaves();
            }
            return count;
        }

        [[nodiscard]] std::string describe() const
        {
            std::ostringstream stream;
            write(stream);
            return stream.str();
        }

    private:
        void write(std::ostringstream& stream) const
        {
            if (leaf) {
                stream << c10::toString(dtype) << '(';
                for (std::size_t i = 0; i < sizes.size(); ++i) {
                    if (i > 0) {
                        stream << ", ";
                    }
                    stream << sizes[i];
                }
                stream << ')';
                return;
            }
            stream << '[';
            for (std::size_t i = 0; i < children.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                children[i].write(stream);
            }
            stream << ']';
        }
    };

    [[nodiscard]] inline bool operator==(const Structure& lhs, const Structure& rhs)
    {
        if (lhs.leaf != rhs.leaf) {
            return false;
        }
        if (lhs.leaf) {
            return lhs.sizes == rhs.sizes && lhs.dtype == rhs.dtype;
        }
        if (lhs.children.size() != rhs.children.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs.children.size(); ++i) {
            if (!(lhs.children[i] == rhs.children[i])) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] inline bool operator!=(const Structure& lhs, const Structure& rhs) { return !(lhs == rhs); }

    namespace Details {
        inline Structure describe_node(const PhasePoint& point)
        {
            Structure structure{};
            if (point.is_leaf()) {
                const auto& tensor = point.tensor();
                if (!tensor.defined()) {
                    throw ShapeMismatchError("Phase point contains an undefined tensor leaf.");
                }
                structure.leaf = true;
                structure.sizes = tensor.sizes().vec();
                structure.dtype = tensor.scalar_type();
                return structure;
            }
            structure.children.reserve(point.size());
            for (const auto& child : point.children()) {
                structure.children.push_back(describe_node(child));
            }
            return structure;
        }

        inline PhasePoint rebuild(const Structure& structure, std::vector<torch::Tensor>& leaves, std::size_t& cursor)
        {
            if (structure.leaf) {
                auto& tensor = leaves[cursor];
                if (!tensor.defined()) {
                    throw ShapeMismatchError("Leaf #" + std::to_string(cursor) + " is undefined; expected "
                                             + structure.describe() + ".");
                }
                if (tensor.sizes() != c10::IntArrayRef(structure.sizes) || tensor.scalar_type() != structure.dtype) {
                    Structure actual{};
                    actual.leaf = true;
                    actual.sizes = tensor.sizes().vec();
                    actual.dtype = tensor.scalar_type();
                    throw ShapeMismatchError("Leaf #" + std::to_string(cursor) + " is " + actual.describe()
                                             + " but the recorded structure expects " + structure.describe() + ".");
                }
                ++cursor;
                return PhasePoint(std::move(tensor));
            }
            std::vector<PhasePoint> children;
            children.reserve(structure.children.size());
            for (const auto& child : structure.children) {
                children.push_back(rebuild(child, leaves, cursor));
            }
            return PhasePoint(std::move(children));
        }
    }

    [[nodiscard]] inline Structure structure_of(const PhasePoint& point)
    {
        return Details::describe_node(point);
    }

    [[nodiscard]] inline std::pair<std::vector<torch::Tensor>, Structure> flatten(const PhasePoint& point)
    {
        return {point.leaves(), structure_of(point)};
    }

    // Inverse of flatten. Every leaf must match the recorded sizes and dtype.
    [[nodiscard]] inline PhasePoint unflatten(const Structure& structure, std::vector<torch::Tensor> leaves)
    {
        const auto expected = structure.num_leaves();
        if (leaves.size() != expected) {
            throw ShapeMismatchError("Cannot rebuild " + structure.describe() + " from "
                                     + std::to_string(leaves.size()) + " leaves; expected "
                                     + std::to_string(expected) + ".");
        }
        std::size_t cursor = 0;
        return Details::rebuild(structure, leaves, cursor);
    }

    inline void require_structure(const PhasePoint& point, const Structure& expected, const std::string& what)
    {
        const auto actual = structure_of(point);
        if (actual != expected) {
            throw ShapeMismatchError(what + " has structure " + actual.describe() + " but "
                                     + expected.describe() + " was expected.");
        }
    }

    [[nodiscard]] inline PhasePoint operator+(const PhasePoint& lhs, const PhasePoint& rhs)
    {
        return PhasePoint::zip(lhs, rhs, [](const torch::Tensor& a, const torch::Tensor& b) { return a + b; });
    }

    [[nodiscard]] inline PhasePoint operator-(const PhasePoint& lhs, const PhasePoint& rhs)
    {
        return PhasePoint::zip(lhs, rhs, [](const torch::Tensor& a, const torch::Tensor& b) { return a - b; });
    }

    [[nodiscard]] inline PhasePoint operator-(const PhasePoint& point)
    {
        return point.map([](const torch::Tensor& a) { return a.neg(); });
    }

    [[nodiscard]] inline PhasePoint operator*(double scale, const PhasePoint& point)
    {
        return point.map([scale](const torch::Tensor& a) { return a * scale; });
    }

    [[nodiscard]] inline PhasePoint operator*(const PhasePoint& point, double scale)
    {
        return scale * point;
    }

    [[nodiscard]] inline PhasePoint zeros_like(const PhasePoint& point)
    {
        return point.map([](const torch::Tensor& a) { return torch::zeros_like(a); });
    }

    [[nodiscard]] inline PhasePoint ones_like(const PhasePoint& point)
    {
        return point.map([](const torch::Tensor& a) { return torch::ones_like(a); });
    }

    [[nodiscard]] inline PhasePoint detach(const PhasePoint& point)
    {
        return point.map([](const torch::Tensor& a) { return a.detach(); });
    }

    [[nodiscard]] inline bool all_finite(const PhasePoint& point)
    {
        const auto leaves = point.leaves();
        return std::all_of(leaves.begin(), leaves.end(), [](const torch::Tensor& leaf) {
            return leaf.numel() == 0 || torch::isfinite(leaf).all().item<bool>();
        });
    }

    // Largest absolute entry over every leaf; 0 for a point without entries, NaN as soon
    // as any entry is NaN.
    [[nodiscard]] inline double max_abs(const PhasePoint& point)
    {
        double result = 0.0;
        for (const auto& leaf : point.leaves()) {
            if (leaf.numel() == 0) {
                continue;
            }
            const double leaf_max = leaf.abs().max().item<double>();
            if (std::isnan(leaf_max)) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            result = std::max(result, leaf_max);
        }
        return result;
    }
}

#endif // ODIN_COMMON_PHASE_POINT_HPP
