#include "pch.h"

#include "AgeRisk.Core/exception.h"

#include <string>

TEST(TestCore_Exception, CarriesSourceLocation) {
    using namespace agerisk::core;

    try {
        throw InvalidInput("bad series");
    } catch (const AgeRiskException &ex) {
        auto message = std::string{ex.what()};
        ASSERT_NE(std::string::npos, message.find("bad series"));
        ASSERT_NE(std::string::npos, message.find("Core.Exception.Test.cpp"));
        ASSERT_LT(0u, ex.line());
        ASSERT_NE(std::string::npos, std::string{ex.file_name()}.find("Core.Exception.Test.cpp"));
        ASSERT_NE(nullptr, ex.function_name());
    }
}

TEST(TestCore_Exception, TypedHierarchy) {
    using namespace agerisk::core;

    ASSERT_THROW(throw InvalidParameter("p"), AgeRiskException);
    ASSERT_THROW(throw DegenerateTarget("t"), AgeRiskException);
    ASSERT_THROW(throw FitDidNotConverge("f"), std::runtime_error);
}
