#include "tidy/utils/NamePolicy.h"
#include "tidy/utils/path_utils.h"
#include "tidy/errors.h"
#include "framework.h"

#include <string>
#include <vector>

namespace fs = std::filesystem;

using tidy::utils::PosixNamePolicy;
using tidy::utils::WindowsNamePolicy;

void testWindowsPolicyRejectsReservedNames() {
    const WindowsNamePolicy policy;

    ASSERT_THROWS(policy.validate(fs::path("boa/null/aux.log")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("CON")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("logs/com1.txt")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("Lpt9")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("nul/app.log")), tidy::InvalidNameError);

    ASSERT_TRUE(WindowsNamePolicy::isReservedName("prn.log"));
    ASSERT_FALSE(WindowsNamePolicy::isReservedName("null"));
    ASSERT_FALSE(WindowsNamePolicy::isReservedName("console.log"));
    ASSERT_FALSE(WindowsNamePolicy::isReservedName("COM10"));
}

void testWindowsPolicyRejectsInvalidCharacters() {
    const WindowsNamePolicy policy;

    ASSERT_THROWS(policy.validate(fs::path("inva|id:log*name?.log")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("logs/a<b.log")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("quote\"d.log")), tidy::InvalidNameError);
    ASSERT_THROWS(policy.validate(fs::path("logs/time:12.log")), tidy::InvalidNameError);
}

void testWindowsPolicyAcceptsParentDirectories() {
    const WindowsNamePolicy policy;
    const std::vector<std::string> validNames{
        "app.log",
        "logs/app.log",
        "logs\\nested\\app.log",
        "C:/logs/app.log",
        "D:\\logs\\app",
    };

    for (const auto& name : validNames) {
        policy.validate(fs::path(name));
    }
}

void testPosixPolicyAcceptsWindowsSpecialNames() {
    const PosixNamePolicy policy;

    policy.validate(fs::path("inva|id:log*name?.log"));
    policy.validate(fs::path("boa/null/aux.log"));
}

void testResolveAppliesPolicy() {
    const WindowsNamePolicy windowsPolicy;
    const PosixNamePolicy posixPolicy;

    ASSERT_THROWS(
        tidy::utils::resolveLogFileSpec(fs::path("boa/null/aux.log"), true, windowsPolicy, "20240102"),
        tidy::InvalidNameError
    );
    ASSERT_THROWS(
        tidy::utils::resolveLogFileSpec(fs::path("inva|id:log*name?.log"), false, windowsPolicy, "20240102"),
        tidy::InvalidNameError
    );

    auto spec = tidy::utils::resolveLogFileSpec(fs::path("boa/null/aux.log"), true, posixPolicy, "20240102");
    ASSERT_EQ(spec.path(), fs::path("boa/null/aux_20240102.log"));
}

void testCurrentPlatformPolicy() {
    const auto& policy = tidy::utils::NamePolicy::forCurrentPlatform();

#ifdef _WIN32
    ASSERT_TRUE(dynamic_cast<const WindowsNamePolicy*>(&policy) != nullptr);
#else
    ASSERT_TRUE(dynamic_cast<const PosixNamePolicy*>(&policy) != nullptr);
#endif // _WIN32
}
