#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

#include "intra_cli/command.hpp"
#include "intra_core/services/user_resolver.hpp"

namespace intra_cli {

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline constexpr int kLabelWidth = 20;

/**
 * @brief Prints the profile fields selected by a Command.
 *
 * Every line is a 20-column label followed by the value. Output already
 * written stays written when a later renderer throws.
 */
class CommandDispatcher {
 public:
  CommandDispatcher(std::ostream &out, Clock now,
                    std::optional<std::string> cursus = std::nullopt);

  void dispatch(Command command, const intra_core::ResolvedUser &user);

  void id(const intra_core::UserSummary &summary);
  void me(const intra_core::UserProfile &profile);
  void email(const intra_core::UserProfile &profile);
  void login(const intra_core::UserProfile &profile);
  void correction_point(const intra_core::UserProfile &profile);
  void wallet(const intra_core::UserProfile &profile);
  void blackhole(const intra_core::UserProfile &profile);

  /**
   * @brief The enrollment the cursus, grade and blackhole lines describe.
   *
   * With a cursus preference, the enrollment whose cursus name, slug or id
   * matches it. Without one, the second enrollment of the profile.
   * @throws intra_core::CursusNotFound if there is no such enrollment.
   */
  const intra_core::CursusUser &selected_cursus(const intra_core::UserProfile &profile) const;

 private:
  std::ostream &out_;
  Clock now_;
  std::optional<std::string> cursus_;

  template <typename T>
  void print_field(const std::string &label, const T &value);
};

}  // namespace intra_cli
