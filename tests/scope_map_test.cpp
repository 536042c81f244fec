// Scope Map tests
//
// Immutability, last-write-wins, null-like values versus absent keys, and
// equivalence of the chained and bulk extension strategies.

#include "scoped/scope_map.hpp"

#include <algorithm>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace scoped;

namespace {

Var<int> count_var{"scope-map-test/count"};
Var<std::string> label_var{"scope-map-test/label", "root"};
Var<std::optional<std::string>> maybe_var{"scope-map-test/maybe"};
Var<bool> flag_var{"scope-map-test/flag", true};

} // namespace

// ============================================================================
// Empty map
// ============================================================================

TEST(ScopeMapTest, EmptyIsSingleton) {
    const ScopeMap& a = ScopeMap::empty();
    const ScopeMap& b = ScopeMap::empty();
    EXPECT_TRUE(a.identical(b));
    EXPECT_TRUE(a.is_empty());
    EXPECT_EQ(a.size(), 0u);
}

TEST(ScopeMapTest, DefaultConstructedSharesEmptyStorage) {
    ScopeMap map;
    EXPECT_TRUE(map.identical(ScopeMap::empty()));
}

TEST(ScopeMapTest, GetOnEmptyReturnsNull) {
    EXPECT_EQ(ScopeMap::empty().get(count_var), nullptr);
    EXPECT_FALSE(ScopeMap::empty().contains(count_var));
    EXPECT_EQ(ScopeMap::empty().get_as(count_var), nullptr);
}

// ============================================================================
// assoc
// ============================================================================

TEST(ScopeMapTest, AssocDoesNotMutateOriginal) {
    ScopeMap base = ScopeMap::empty().assoc(bind(count_var, 1));
    ScopeMap next = base.assoc(bind(count_var, 2));

    ASSERT_NE(base.get_as(count_var), nullptr);
    EXPECT_EQ(*base.get_as(count_var), 1);
    EXPECT_EQ(*next.get_as(count_var), 2);
    EXPECT_FALSE(base.identical(next));
}

TEST(ScopeMapTest, AssocAddsNewKey) {
    ScopeMap map = ScopeMap::empty().assoc(bind(count_var, 7)).assoc(bind(label_var, "x"));
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(*map.get_as(count_var), 7);
    EXPECT_EQ(*map.get_as(label_var), "x");
}

TEST(ScopeMapTest, KeysAreSortedIds) {
    ScopeMap map = extend(ScopeMap::empty(), {bind(flag_var, false), bind(count_var, 1)});
    std::vector<VarId> expected = {count_var.id(), flag_var.id()};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(map.keys(), expected);
}

// ============================================================================
// Null-like values versus absent keys
// ============================================================================

TEST(ScopeMapTest, NulloptIsAPresentValue) {
    ScopeMap map = ScopeMap::empty().assoc(bind(maybe_var, std::nullopt));

    const std::any* raw = map.get(maybe_var);
    ASSERT_NE(raw, nullptr);
    const auto* typed = map.get_as(maybe_var);
    ASSERT_NE(typed, nullptr);
    EXPECT_FALSE(typed->has_value());
}

TEST(ScopeMapTest, FalseIsAPresentValue) {
    ScopeMap map = ScopeMap::empty().assoc(bind(flag_var, false));
    ASSERT_TRUE(map.contains(flag_var));
    EXPECT_FALSE(*map.get_as(flag_var));
}

// ============================================================================
// Binding validation
// ============================================================================

TEST(BindingTest, RejectsNullVar) {
    EXPECT_THROW((void)Binding(nullptr, std::any(1)), std::invalid_argument);
}

TEST(BindingTest, RejectsWrongValueType) {
    EXPECT_THROW((void)Binding(&count_var, std::any(std::string("one"))), std::invalid_argument);
}

TEST(BindingTest, RejectsEmptyAny) {
    EXPECT_THROW((void)Binding(&count_var, std::any()), std::invalid_argument);
}

TEST(BindingTest, BindConvertsToVarType) {
    Binding b = bind(label_var, "literal");
    EXPECT_EQ(b.value().type(), typeid(std::string));
    EXPECT_EQ(&b.var(), &label_var);
}

TEST(BindingTest, UnqualifiedBindPicksScopedOverStdBind) {
    // <functional> is included, so std::bind is reachable through
    // argument-dependent lookup on std::string and std::optional.
    Var<std::string> local{"scope-map-test/local"};
    auto from_mutable = bind(local, "x");
    static_assert(std::is_same_v<decltype(from_mutable), Binding>);
    EXPECT_EQ(std::any_cast<std::string>(from_mutable.value()), "x");

    auto from_optional = bind(maybe_var, std::string("y"));
    static_assert(std::is_same_v<decltype(from_optional), Binding>);
    EXPECT_EQ(&from_optional.var(), &maybe_var);

    const Var<std::string>& as_const = local;
    auto from_const = bind(as_const, std::string("z"));
    static_assert(std::is_same_v<decltype(from_const), Binding>);
    EXPECT_EQ(&from_const.var(), &local);
}

// ============================================================================
// extend
// ============================================================================

TEST(ExtendTest, NoBindingsReturnsSameMap) {
    ScopeMap base = ScopeMap::empty().assoc(bind(count_var, 1));
    std::vector<Binding> none;
    ScopeMap result = extend(base, none);
    EXPECT_TRUE(result.identical(base));
}

TEST(ExtendTest, LastBindingWins) {
    ScopeMap map = extend(ScopeMap::empty(), {bind(count_var, 1), bind(count_var, 2)});
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(*map.get_as(count_var), 2);
}

TEST(ExtendTest, OverridesAndAugmentsBase) {
    ScopeMap base = extend(ScopeMap::empty(), {bind(count_var, 1), bind(label_var, "base")});
    ScopeMap next = extend(base, {bind(label_var, "next"), bind(flag_var, false)});

    EXPECT_EQ(*next.get_as(count_var), 1);
    EXPECT_EQ(*next.get_as(label_var), "next");
    EXPECT_FALSE(*next.get_as(flag_var));

    EXPECT_EQ(*base.get_as(label_var), "base");
    EXPECT_FALSE(base.contains(flag_var));
}

TEST(ExtendTest, BuilderIsSingleUse) {
    ScopeMap::Builder builder(ScopeMap::empty());
    builder.assoc(bind(count_var, 3));
    ScopeMap built = builder.build();
    EXPECT_EQ(*built.get_as(count_var), 3);

    EXPECT_THROW((void)builder.build(), std::logic_error);
    EXPECT_THROW(builder.assoc(bind(count_var, 4)), std::logic_error);
    EXPECT_EQ(*built.get_as(count_var), 3);
}

class ExtendStrategyTest : public ::testing::Test {
protected:
    std::vector<std::unique_ptr<Var<int>>> vars_;

    void SetUp() override {
        for (int i = 0; i < 12; ++i) {
            vars_.push_back(std::make_unique<Var<int>>("scope-map-test/v" + std::to_string(i)));
        }
    }

    std::vector<Binding> bindings(int offset) const {
        std::vector<Binding> result;
        for (size_t i = 0; i < vars_.size(); ++i) {
            result.push_back(bind(*vars_[i], static_cast<int>(i) + offset));
        }
        // Repeat the first var so last-write-wins is exercised on both paths.
        result.push_back(bind(*vars_[0], -1));
        return result;
    }

    void expect_same(const ScopeMap& a, const ScopeMap& b) const {
        ASSERT_EQ(a.keys(), b.keys());
        for (const auto& var : vars_) {
            const int* x = a.get_as(*var);
            const int* y = b.get_as(*var);
            ASSERT_EQ(x == nullptr, y == nullptr);
            if (x) {
                EXPECT_EQ(*x, *y);
            }
        }
    }
};

TEST_F(ExtendStrategyTest, ChainedAndBulkProduceEqualMaps) {
    ScopeMap base = ScopeMap::empty().assoc(bind(*vars_[5], 500));
    auto input = bindings(10);

    ScopeMap chained = extend(base, input, ExtendStrategy::Chained);
    ScopeMap bulk = extend(base, input, ExtendStrategy::Bulk);
    ScopeMap automatic = extend(base, input);

    expect_same(chained, bulk);
    expect_same(chained, automatic);
    EXPECT_EQ(*bulk.get_as(*vars_[0]), -1);
    EXPECT_EQ(*bulk.get_as(*vars_[5]), 15);
    EXPECT_EQ(*base.get_as(*vars_[5]), 500);
    EXPECT_EQ(base.size(), 1u);
}

TEST_F(ExtendStrategyTest, SmallInputsAgreeToo) {
    std::vector<Binding> input = {bind(*vars_[1], 1), bind(*vars_[2], 2), bind(*vars_[1], 3)};
    expect_same(extend(ScopeMap::empty(), input, ExtendStrategy::Chained),
                extend(ScopeMap::empty(), input, ExtendStrategy::Bulk));
}
