#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "maybe/interceptor.hpp"
#include "maybe/logging.hpp"

namespace {

    int g_logged = 0;

    void count_log(std::string_view) {
        ++g_logged;
    }

    int parse_positive(int value) {
        if (value <= 0) {
            maybe::report_error(maybe::Severity::kWarning, "value must be positive");
            return -1;
        }
        return value;
    }

    class InterceptorTest : public ::testing::Test {
      protected:
        void SetUp() override {
            g_logged = 0;
            maybe::set_log_sink(maybe::LogLevel::kError, count_log);
        }

        void TearDown() override {
            maybe::clear_log_sink(maybe::LogLevel::kError);
            EXPECT_EQ(maybe::error_handler_depth(), 0U);
        }
    };

    TEST_F(InterceptorTest, ReturnsGeneratorValueWithoutErrors) {
        bool                              recovered = false;
        const maybe::Interceptor<int(int)> interceptor(parse_positive, [&recovered]() {
            recovered = true;
            return 0;
        });

        EXPECT_EQ(interceptor.invoke(7), 7);
        EXPECT_FALSE(recovered);
    }

    TEST_F(InterceptorTest, ReturnsRecoveryValueOnError) {
        const maybe::Interceptor<int(int)> interceptor(parse_positive, []() { return 42; });

        EXPECT_EQ(interceptor.invoke(-3), 42);
        EXPECT_EQ(g_logged, 0);
    }

    TEST_F(InterceptorTest, RecoverySeesSeverityAndMessage) {
        maybe::Severity                    seen_severity = maybe::Severity::kError;
        std::string                        seen_message;
        const maybe::Interceptor<int(int)> interceptor(parse_positive, [&](maybe::Severity severity, std::string_view message) {
            seen_severity = severity;
            seen_message  = std::string(message);
            return 0;
        });

        interceptor.invoke(0);

        EXPECT_EQ(seen_severity, maybe::Severity::kWarning);
        EXPECT_EQ(seen_message, "value must be positive");
    }

    TEST_F(InterceptorTest, RecoveryReceivesFullEvent) {
        const maybe::Interceptor<std::string()> interceptor(
            []() {
                maybe::report_error(maybe::Severity::kDeprecated, "old flag", maybe::Value{{"flag", "--legacy"}});
                return std::string("ok");
            },
            [](const maybe::ErrorEvent& event) { return event.context.at("flag").get<std::string>(); });

        EXPECT_EQ(interceptor.invoke(), "--legacy");
    }

    TEST_F(InterceptorTest, LastEventWins) {
        int                            calls = 0;
        const maybe::Interceptor<int()> interceptor(
            []() {
                maybe::report_error(maybe::Severity::kNotice, "first");
                maybe::report_error(maybe::Severity::kWarning, "second");
                return 0;
            },
            [&calls](const maybe::ErrorEvent& event) {
                ++calls;
                return static_cast<int>(event.severity);
            });

        EXPECT_EQ(interceptor.invoke(), static_cast<int>(maybe::Severity::kWarning));
        EXPECT_EQ(calls, 2);
    }

    TEST_F(InterceptorTest, FatalSeverityIsIntercepted) {
        const maybe::Interceptor<int()> interceptor(
            []() {
                maybe::report_error(maybe::Severity::kUserError, "giving up");
                return 1;
            },
            []() { return 2; });

        EXPECT_EQ(interceptor.invoke(), 2);
    }

    TEST_F(InterceptorTest, RecoveryExceptionPropagatesAndRestoresHandler) {
        int                       outer_calls = 0;
        maybe::ScopedErrorHandler outer([&outer_calls](const maybe::ErrorEvent&) {
            ++outer_calls;
            return true;
        });
        const maybe::Interceptor<int(int)> interceptor(parse_positive, []() -> int { throw std::runtime_error("no fallback"); });

        EXPECT_THROW(interceptor.invoke(-1), std::runtime_error);
        EXPECT_EQ(maybe::error_handler_depth(), 1U);
        EXPECT_FALSE(maybe::reporting_suppressed());

        maybe::report_error(maybe::Severity::kWarning, "after");
        EXPECT_EQ(outer_calls, 1);
    }

    TEST_F(InterceptorTest, GeneratorExceptionPropagatesDirectly) {
        bool                            recovered = false;
        const maybe::Interceptor<int()> interceptor([]() -> int { throw std::logic_error("hard fault"); },
                                                    [&recovered]() {
                                                        recovered = true;
                                                        return 0;
                                                    });

        EXPECT_THROW(interceptor.invoke(), std::logic_error);
        EXPECT_FALSE(recovered);
        EXPECT_EQ(maybe::error_handler_depth(), 0U);
    }

    TEST_F(InterceptorTest, RestoresPreviousHandler) {
        std::string last_outer;
        {
            maybe::ScopedErrorHandler outer([&last_outer](const maybe::ErrorEvent& event) {
                last_outer = event.message;
                return true;
            });
            const maybe::Interceptor<int(int)> interceptor(parse_positive, []() { return 0; });

            interceptor.invoke(-1);
            interceptor.invoke(5);
            EXPECT_EQ(maybe::error_handler_depth(), 1U);

            maybe::report_error(maybe::Severity::kNotice, "outer sees this");
        }

        EXPECT_EQ(last_outer, "outer sees this");
    }

    TEST_F(InterceptorTest, NestedInterceptorsRestoreInOrder) {
        const maybe::Interceptor<int()> inner(
            []() {
                maybe::report_error(maybe::Severity::kWarning, "inner");
                return 0;
            },
            []() { return 10; });
        const maybe::Interceptor<int()> outer(
            [&inner]() {
                const int value = inner.invoke();
                EXPECT_EQ(maybe::error_handler_depth(), 1U);
                maybe::report_error(maybe::Severity::kWarning, "outer");
                return value;
            },
            []() { return 20; });

        EXPECT_EQ(outer.invoke(), 20);
        EXPECT_EQ(inner.invoke(), 10);
    }

    TEST_F(InterceptorTest, InterceptorInsideRecoveryGetsItsOwnEvents) {
        std::string                     inner_message;
        const maybe::Interceptor<int()> inner(
            []() {
                maybe::report_error(maybe::Severity::kWarning, "from inner generator");
                return 0;
            },
            [&inner_message](const maybe::ErrorEvent& event) {
                inner_message = event.message;
                return 7;
            });
        int                             outer_calls = 0;
        const maybe::Interceptor<int()> outer(
            []() {
                maybe::report_error(maybe::Severity::kWarning, "from outer generator");
                return 0;
            },
            [&inner, &outer_calls]() {
                ++outer_calls;
                EXPECT_EQ(maybe::error_handler_depth(), 1U);
                const int value = inner.invoke();
                EXPECT_EQ(maybe::error_handler_depth(), 1U);
                return value * 10;
            });

        EXPECT_EQ(outer.invoke(), 70);
        EXPECT_EQ(outer_calls, 1);
        EXPECT_EQ(inner_message, "from inner generator");
        EXPECT_EQ(g_logged, 0);
    }

    TEST_F(InterceptorTest, ErrorInsideRecoveryDoesNotRecurse) {
        int                             calls = 0;
        const maybe::Interceptor<int()> interceptor(
            []() {
                maybe::report_error(maybe::Severity::kWarning, "generator");
                return 0;
            },
            [&calls]() {
                ++calls;
                maybe::report_error(maybe::Severity::kNotice, "recovery");
                return 5;
            });

        EXPECT_EQ(interceptor.invoke(), 5);
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(g_logged, 0);
    }

    TEST_F(InterceptorTest, RejectsEmptyGenerator) {
        const std::function<int()> empty;

        EXPECT_THROW((maybe::Interceptor<int()>(empty, []() { return 0; })), std::invalid_argument);
        EXPECT_THROW((maybe::Interceptor<int()>(nullptr, []() { return 0; })), std::invalid_argument);
    }

    TEST_F(InterceptorTest, RejectsEmptyRecovery) {
        const std::function<int()> empty;
        int (*null_recovery)()      = nullptr;

        try {
            maybe::Interceptor<int()> interceptor([]() { return 0; }, empty);
            FAIL() << "expected invalid_argument";
        } catch (const std::invalid_argument& ex) {
            EXPECT_STREQ(ex.what(), "Invalid recovery given, needs to be callable");
        }
        EXPECT_THROW((maybe::Interceptor<int()>([]() { return 0; }, null_recovery)), std::invalid_argument);
        EXPECT_THROW((maybe::Interceptor<int()>([]() { return 0; }, nullptr)), std::invalid_argument);
    }

    TEST_F(InterceptorTest, SettersRevalidate) {
        maybe::Interceptor<int()> interceptor([]() { return 1; }, []() { return 2; });

        EXPECT_THROW(interceptor.set_generator(std::function<int()>{}), std::invalid_argument);
        EXPECT_EQ(interceptor.invoke(), 1);

        interceptor.set_generator([]() {
                       maybe::report_error(maybe::Severity::kWarning, "changed");
                       return 1;
                   })
            .set_recovery([]() { return 3; });

        EXPECT_EQ(interceptor.invoke(), 3);
    }

}
