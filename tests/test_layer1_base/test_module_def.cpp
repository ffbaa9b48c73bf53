/**
 * @file test_module_def.cpp
 * @brief Layer 1 tests for ModuleDef argument validation.
 */
#include "lkh_base.hpp"
#include <gtest/gtest.h>

#include <string>

using namespace lockhub::utils;

TEST(ModuleDefTest, RejectsEmptyName)
{
    EXPECT_THROW(ModuleDef(""), std::invalid_argument);
}

TEST(ModuleDefTest, RejectsNameExceedingMaxLength)
{
    std::string long_name(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'x');
    EXPECT_THROW(ModuleDef mod(long_name), std::length_error);
}

TEST(ModuleDefTest, AcceptsNameAtMaxLength)
{
    std::string max_name(ModuleDef::MAX_MODULE_NAME_LEN, 'a');
    EXPECT_NO_THROW({ ModuleDef mod(max_name); });
}

TEST(ModuleDefTest, AddDependency_IgnoresEmpty)
{
    ModuleDef mod("LockManagerRegistry");
    EXPECT_NO_THROW(mod.add_dependency(""));
}

TEST(ModuleDefTest, AddDependency_RejectsNameExceedingMaxLength)
{
    ModuleDef mod("LockManagerRegistry");
    std::string long_dep(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'y');
    EXPECT_THROW(mod.add_dependency(long_dep), std::length_error);
}

TEST(ModuleDefTest, StartupArgument_RejectsOversizedArgument)
{
    ModuleDef mod("Configured");
    std::string big_arg(ModuleDef::MAX_CALLBACK_PARAM_STRLEN + 1, 'z');
    EXPECT_THROW(mod.set_startup([](const char *) {}, big_arg), std::length_error);
}

TEST(ModuleDefTest, IsMovable)
{
    ModuleDef a("Movable");
    a.add_dependency("lockhub::utils::Logger");
    ModuleDef b(std::move(a));
    ModuleDef c("Other");
    EXPECT_NO_THROW(c = std::move(b));
}
