#include "../include/Odin.h"
#include "support/check.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace {
    // [a(2, 3) f32, [b(4) f64, [c() f32, d(1, 2, 2) f32]], e(0) f32]
    Odin::PhasePoint make_nested_point()
    {
        auto a = torch::arange(6, torch::kFloat32).reshape({2, 3});
        auto b = torch::linspace(-1.0, 1.0, 4, torch::kFloat64);
        auto c = torch::scalar_tensor(3.5, torch::kFloat32);
        auto d = torch::randn({1, 2, 2}, torch::kFloat32);
        auto e = torch::zeros({0}, torch::kFloat32);

        return Odin::PhasePoint::list({
            a,
            Odin::PhasePoint::list({b, Odin::PhasePoint::list({c, d})}),
            e,
        });
    }
}

int main()
{
    OdinTest::Suite suite{"phase_point"};

    suite.run("flatten/unflatten reproduces a nested tree", [&] {
        const auto point = make_nested_point();
        auto [leaves, structure] = Odin::flatten(point);

        suite.expect(leaves.size() == 5, "five leaves in depth-first order");
        suite.expect(structure.num_leaves() == 5, "structure counts five leaves");
        suite.expect(!structure.leaf && structure.children.size() == 3, "root is a list of three");

        const auto rebuilt = Odin::unflatten(structure, leaves);
        suite.expect(Odin::structure_of(rebuilt) == structure, "rebuilt tree has the recorded structure");

        const auto original_leaves = point.leaves();
        const auto rebuilt_leaves = rebuilt.leaves();
        bool identical = true;
        for (std::size_t i = 0; i < original_leaves.size(); ++i) {
            identical = identical
                && original_leaves[i].scalar_type() == rebuilt_leaves[i].scalar_type()
                && original_leaves[i].sizes() == rebuilt_leaves[i].sizes()
                && torch::equal(original_leaves[i], rebuilt_leaves[i]);
        }
        suite.expect(identical, "leaf dtypes, shapes and values survive");
        suite.expect(rebuilt[1][1][0].tensor().dim() == 0, "scalar leaf stays 0-d");
        suite.expect(rebuilt[1][0].tensor().scalar_type() == torch::kFloat64, "double leaf stays double");
    });

    suite.run("unflatten rejects leaves that do not match", [&] {
        const auto point = make_nested_point();
        const auto flattened = Odin::flatten(point);
        const auto& leaves = flattened.first;
        const auto& structure = flattened.second;

        suite.expect_throws<Odin::ShapeMismatchError>([&] {
            auto fewer = leaves;
            fewer.pop_back();
            (void)Odin::unflatten(structure, fewer);
        }, "missing leaf");

        suite.expect_throws<Odin::ShapeMismatchError>([&] {
            auto reshaped = leaves;
            reshaped[0] = reshaped[0].reshape({3, 2});
            (void)Odin::unflatten(structure, reshaped);
        }, "leaf with a different shape");

        suite.expect_throws<Odin::ShapeMismatchError>([&] {
            auto retyped = leaves;
            retyped[1] = retyped[1].to(torch::kFloat32);
            (void)Odin::unflatten(structure, retyped);
        }, "leaf with a different dtype");

        suite.expect_throws<Odin::ShapeMismatchError>([&] {
            auto undefined = leaves;
            undefined[2] = torch::Tensor();
            (void)Odin::unflatten(structure, undefined);
        }, "undefined leaf");
    });

    suite.run("leaf-wise arithmetic", [&] {
        const auto point = Odin::PhasePoint::list({torch::ones({2}), Odin::PhasePoint::list({torch::full({3}, 2.0)})});
        const auto sum = point + 3.0 * point;
        suite.expect_close(sum[0].tensor(), torch::full({2}, 4.0), 0.0, "sum of first leaf");
        suite.expect_close(sum[1][0].tensor(), torch::full({3}, 8.0), 0.0, "sum of nested leaf");
        suite.expect_close((-point)[1][0].tensor(), torch::full({3}, -2.0), 0.0, "negation");
        suite.expect_near(Odin::max_abs(sum), 8.0, 0.0, "max_abs over all leaves");

        const auto flat = Odin::PhasePoint::list({torch::ones({2}), torch::ones({3})});
        suite.expect_throws<Odin::ShapeMismatchError>([&] { (void)(point + flat); }, "adding mismatched nestings");
        suite.expect_throws<Odin::ShapeMismatchError>([&] { (void)Odin::PhasePoint(torch::ones({2})).children(); },
                                                       "children of a leaf");
    });

    suite.run("finiteness", [&] {
        auto point = Odin::PhasePoint::list({torch::ones({2}), torch::zeros({0})});
        suite.expect(Odin::all_finite(point), "finite tree");
        auto broken = Odin::PhasePoint::list({torch::tensor({1.0, std::numeric_limits<double>::quiet_NaN()}), torch::zeros({0})});
        suite.expect(!Odin::all_finite(broken), "NaN detected");
        suite.expect_near(Odin::max_abs(Odin::PhasePoint::list({})), 0.0, 0.0, "empty tree has max_abs 0");
        suite.expect(std::isnan(Odin::max_abs(broken)), "NaN propagates through max_abs");
    });

    return suite.finish();
}
