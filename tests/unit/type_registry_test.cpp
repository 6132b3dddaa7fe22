#include "restora/core/TypeRegistry.hpp"
#include "test_utils/RecoveryScenarios.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace
{

using restora::core::RecoverableType;
using restora::core::RecoveryError;
using restora::core::TypeRegistry;
using restora::core::Value;

[[nodiscard]] RecoverableType namedType(std::string name)
{
    auto type{ restora::test_utils::pointType() };
    type.name = std::move(name);
    return type;
}

[[nodiscard]] TypeRegistry buildOrFail(std::vector<RecoverableType> types)
{
    auto built{ TypeRegistry::build(std::move(types)) };
    if (restora::core::isError(built))
    {
        ADD_FAILURE() << "registry build failed";
        auto empty{ TypeRegistry::build({}) };
        return std::move(std::get<TypeRegistry>(empty));
    }
    return std::move(std::get<TypeRegistry>(built));
}

} // namespace

TEST(TypeRegistry, BuiltinOrderIsFixed)
{
    const auto registry{ buildOrFail({}) };
    const std::vector<std::string> expected{ "none",  "str",  "int",     "float",    "bool", "list", "tuple",
                                             "uuid",  "dict", "decimal", "datetime", "date", "time" };

    ASSERT_EQ(registry.entries().size(), expected.size());
    for (std::size_t i{}; i < expected.size(); ++i)
    {
        EXPECT_EQ(registry.entries()[i].name, expected[i]);
        EXPECT_EQ(registry.entries()[i].id, std::to_string(i));
    }
}

TEST(TypeRegistry, DomainTypesFollowBuiltinsInDeclarationOrder)
{
    const auto registry{ buildOrFail({ namedType("Point"), namedType("Circle") }) };

    ASSERT_NE(registry.findByName("Point"), nullptr);
    ASSERT_NE(registry.findByName("Circle"), nullptr);
    ASSERT_NE(registry.findByName("decimal"), nullptr);
    EXPECT_EQ(registry.findByName("Point")->id, "9");
    EXPECT_EQ(registry.findByName("Circle")->id, "10");
    EXPECT_EQ(registry.findByName("decimal")->id, "11");
    EXPECT_EQ(registry.findByName("time")->id, "14");
}

TEST(TypeRegistry, SameWhitelistGivesSameIds)
{
    const auto a{ buildOrFail({ namedType("Point"), namedType("Circle") }) };
    const auto b{ buildOrFail({ namedType("Point"), namedType("Circle") }) };

    ASSERT_EQ(a.entries().size(), b.entries().size());
    for (std::size_t i{}; i < a.entries().size(); ++i)
    {
        EXPECT_EQ(a.entries()[i].name, b.entries()[i].name);
        EXPECT_EQ(a.entries()[i].id, b.entries()[i].id);
    }
}

TEST(TypeRegistry, BuiltinValuesMapByKind)
{
    const auto registry{ buildOrFail({}) };

    EXPECT_EQ(registry.idFor(Value{}), "0");
    EXPECT_EQ(registry.idFor(Value{ "s" }), "1");
    EXPECT_EQ(registry.idFor(Value{ 3 }), "2");
    EXPECT_EQ(registry.idFor(Value{ 3.0 }), "3");
    EXPECT_EQ(registry.idFor(Value{ true }), "4");
    EXPECT_EQ(registry.idFor(Value{ restora::core::List{} }), "5");
    EXPECT_EQ(registry.idFor(Value{ restora::core::Tuple{} }), "6");
    EXPECT_EQ(registry.idFor(Value{ restora::core::Uuid{} }), "7");
    EXPECT_EQ(registry.idFor(Value{ restora::core::Mapping{} }), "8");
    EXPECT_EQ(registry.idFor(Value{ restora::core::Time{} }), "12");
}

TEST(TypeRegistry, SubclassResolvesToNearestRegisteredAncestor)
{
    const auto registry{ buildOrFail({ namedType("Point") }) };
    const Value colored{ restora::core::makeObject<restora::test_utils::ColoredPoint>(1, 2, "red") };

    EXPECT_EQ(registry.idFor(colored), "9");
}

TEST(TypeRegistry, ExactTypeWinsOverAncestor)
{
    const auto registry{ buildOrFail({ namedType("Point"), namedType("ColoredPoint") }) };
    const Value colored{ restora::core::makeObject<restora::test_utils::ColoredPoint>(1, 2, "red") };

    EXPECT_EQ(registry.idFor(colored), "10");
}

TEST(TypeRegistry, UnregisteredObjectHasNoId)
{
    const auto registry{ buildOrFail({ namedType("Point") }) };

    EXPECT_FALSE(registry.idFor(restora::core::makeObject<restora::test_utils::Widget>()).has_value());
    EXPECT_FALSE(registry.idFor(Value{ restora::core::ObjectPtr{} }).has_value());
}

TEST(TypeRegistry, TypeForRequiresCanonicalOrdinal)
{
    const auto registry{ buildOrFail({ namedType("Point") }) };

    ASSERT_NE(registry.typeFor("9"), nullptr);
    EXPECT_EQ(registry.typeFor("9")->name, "Point");
    EXPECT_EQ(registry.typeFor("09"), nullptr);
    EXPECT_EQ(registry.typeFor("+9"), nullptr);
    EXPECT_EQ(registry.typeFor("9 "), nullptr);
    EXPECT_EQ(registry.typeFor(""), nullptr);
    EXPECT_EQ(registry.typeFor("14"), nullptr);
    EXPECT_EQ(registry.typeFor("99999999999999999999999"), nullptr);
}

TEST(TypeRegistry, RejectsDuplicateNames)
{
    const auto built{ TypeRegistry::build({ namedType("Point"), namedType("Point") }) };

    ASSERT_TRUE(restora::core::isError(built));
    EXPECT_EQ(std::get<RecoveryError>(built), RecoveryError::ConfigurationError);
}

TEST(TypeRegistry, RejectsReservedAndEmptyNames)
{
    EXPECT_TRUE(restora::core::isError(TypeRegistry::build({ namedType("str") })));
    EXPECT_TRUE(restora::core::isError(TypeRegistry::build({ namedType("datetime") })));
    EXPECT_TRUE(restora::core::isError(TypeRegistry::build({ namedType("") })));
}

TEST(TypeRegistry, RejectsMissingReconstructor)
{
    auto type{ namedType("Point") };
    type.reconstruct = nullptr;

    EXPECT_TRUE(restora::core::isError(TypeRegistry::build({ std::move(type) })));
}
