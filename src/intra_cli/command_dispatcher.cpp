#include "intra_cli/command_dispatcher.hpp"

#include <iomanip>
#include <ostream>

#include "intra_core/config_store.hpp"
#include "intra_core/errors.hpp"
#include "intra_core/utils/timestamp.hpp"

namespace intra_cli {

namespace {

constexpr size_t kDefaultCursusIndex = 1;

std::string first_word(const std::string &text) {
  return text.substr(0, text.find(' '));
}

}  // namespace

CommandDispatcher::CommandDispatcher(std::ostream &out, Clock now,
                                     std::optional<std::string> cursus)
    : out_(out), now_(std::move(now)), cursus_(std::move(cursus)) {}

template <typename T>
void CommandDispatcher::print_field(const std::string &label, const T &value) {
  out_ << std::left << std::setw(kLabelWidth) << label << value << std::endl;
}

void CommandDispatcher::dispatch(Command command, const intra_core::ResolvedUser &user) {
  switch (command) {
    case Command::Id:
      id(user.summary);
      break;
    case Command::Me:
      me(user.profile);
      break;
    case Command::Email:
      email(user.profile);
      break;
    case Command::Login:
      login(user.profile);
      break;
    case Command::CorrectionPoint:
      correction_point(user.profile);
      break;
    case Command::Wallet:
      wallet(user.profile);
      break;
    case Command::Blackhole:
      blackhole(user.profile);
      break;
  }
}

void CommandDispatcher::id(const intra_core::UserSummary &summary) {
  print_field("ID", summary.id);
}

void CommandDispatcher::me(const intra_core::UserProfile &profile) {
  std::string title = profile.titles.empty() ? "" : first_word(profile.titles.front().name);
  out_ << profile.displayname << " | " << title << " " << profile.login << std::endl;

  wallet(profile);
  correction_point(profile);

  const intra_core::CursusUser &cursus = selected_cursus(profile);
  print_field("Cursus", cursus.cursus.name);
  print_field("Grade", cursus.grade.value_or(""));

  blackhole(profile);
}

void CommandDispatcher::email(const intra_core::UserProfile &profile) {
  print_field("Email", profile.email);
}

void CommandDispatcher::login(const intra_core::UserProfile &profile) {
  print_field("Login", profile.login);
}

void CommandDispatcher::correction_point(const intra_core::UserProfile &profile) {
  print_field("Correction point", profile.correction_point);
}

void CommandDispatcher::wallet(const intra_core::UserProfile &profile) {
  print_field("Wallet", profile.wallet);
}

void CommandDispatcher::blackhole(const intra_core::UserProfile &profile) {
  const intra_core::CursusUser &cursus = selected_cursus(profile);
  auto deadline = intra_core::parse_timestamp(cursus.blackholed_at.value_or(""));
  auto now = std::chrono::time_point_cast<std::chrono::seconds>(now_());
  print_field("Blackhole", intra_core::days_between(now, deadline));
}

const intra_core::CursusUser &CommandDispatcher::selected_cursus(
    const intra_core::UserProfile &profile) const {
  if (cursus_) {
    for (const auto &cursus_user : profile.cursus_users) {
      const intra_core::Cursus &c = cursus_user.cursus;
      if (c.name == *cursus_ || c.slug == *cursus_ || std::to_string(c.id) == *cursus_) {
        return cursus_user;
      }
    }
    throw intra_core::CursusNotFound("User " + profile.login + " is not enrolled in cursus '" +
                                     *cursus_ + "'");
  }

  if (profile.cursus_users.size() <= kDefaultCursusIndex) {
    throw intra_core::CursusNotFound("User " + profile.login + " has " +
                                     std::to_string(profile.cursus_users.size()) +
                                     " cursus enrollment(s); set cursus in " +
                                     intra_core::kConfigFileName + " to pick one");
  }
  return profile.cursus_users[kDefaultCursusIndex];
}

}  // namespace intra_cli
