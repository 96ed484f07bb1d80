#ifndef MASUMI_OUTCOME_HPP
#define MASUMI_OUTCOME_HPP

#include <string>
#include <system_error>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

namespace outcome {
  template <class T, class E = std::error_code>
  using result = BOOST_OUTCOME_V2_NAMESPACE::std_result<T, E>;

  using BOOST_OUTCOME_V2_NAMESPACE::success;
  using BOOST_OUTCOME_V2_NAMESPACE::failure;
}  // namespace outcome

/**
 * Declares an error enum as a std::error_code source. Place after the enum,
 * at global scope, in the header that declares it.
 */
#define MASUMI_OUTCOME_DECLARE_ERROR(Namespace, Enum)      \
  namespace Namespace {                                    \
    std::error_code make_error_code(Enum e);               \
  }                                                        \
  namespace std {                                          \
    template <>                                            \
    struct is_error_code_enum<Namespace::Enum> : true_type \
    {                                                      \
    };                                                     \
  }

/**
 * Defines the category of an enum declared with MASUMI_OUTCOME_DECLARE_ERROR.
 * The macro is followed by the body of the message function for value `e`.
 */
#define MASUMI_OUTCOME_DEFINE_CATEGORY(Namespace, Enum, e)                   \
  static std::string Enum##_message(Namespace::Enum e);                      \
  namespace {                                                                \
    class Enum##_category final : public std::error_category                 \
    {                                                                        \
    public:                                                                  \
      const char *name() const noexcept override                             \
      {                                                                      \
        return #Namespace "::" #Enum;                                        \
      }                                                                      \
      std::string message(int value) const override                          \
      {                                                                      \
        return Enum##_message(static_cast<Namespace::Enum>(value));          \
      }                                                                      \
    };                                                                       \
  }                                                                          \
  std::error_code Namespace::make_error_code(Namespace::Enum e)              \
  {                                                                          \
    static const Enum##_category category;                                   \
    return {static_cast<int>(e), category};                                  \
  }                                                                          \
  static std::string Enum##_message(Namespace::Enum e)

#endif  // MASUMI_OUTCOME_HPP
