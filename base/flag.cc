// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/flag.h"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "base/logging.h"

namespace base {

Flag::Flag(std::string name, std::string help)
    : name_(std::move(name)), help_(std::move(help)), required_(false) {}

HelpFlag::HelpFlag() : Flag("help", "Shows this usage information") {
  add_alias("h");
  add_alias("help");
}
void HelpFlag::add_alias(const std::string& name) {
  auto f = [](FlagSet* flagset, bool, const std::string&) -> base::Result {
    flagset->show_help(std::cout);
    exit(0);
  };
  push_hook(name, FlagArgument::none, f);
}
bool HelpFlag::is_set() const noexcept { return false; }
std::string HelpFlag::get() const { return ""; }
std::string HelpFlag::get_default() const { return ""; }
void HelpFlag::reset() {}
base::Result HelpFlag::set(const std::string& value) {
  return base::Result::invalid_argument("--help does not take a value");
}

BoolFlag::BoolFlag(std::string name, bool default_value, std::string help)
    : Flag(std::move(name), std::move(help)),
      default_(default_value),
      value_(default_value),
      isset_(false) {
  add_alias(this->name());
}
void BoolFlag::add_alias(const std::string& name) {
  auto f = [this](FlagSet*, bool have_value, const std::string& value) {
    if (!have_value) return set("true");
    return set(value);
  };
  auto g = [this](FlagSet*, bool, const std::string&) { return set("false"); };

  push_hook(name, FlagArgument::optional, f);
  push_hook("no" + name, FlagArgument::none, g);
}
bool BoolFlag::is_set() const noexcept { return isset_; }
std::string BoolFlag::get() const { return value_ ? "true" : "false"; }
std::string BoolFlag::get_default() const {
  return default_ ? "true" : "false";
}
void BoolFlag::reset() {
  value_ = default_;
  isset_ = false;
}
base::Result BoolFlag::set(const std::string& value) {
  using Map = std::map<std::string, bool>;
  static const Map& map = *new Map{
      {"0", false},     {"1", true},    {"f", false}, {"t", true},
      {"false", false}, {"true", true}, {"n", false}, {"y", true},
      {"no", false},    {"yes", true},
  };

  auto it = map.find(value);
  if (it == map.end())
    return base::Result::invalid_argument("invalid boolean value: \"", value,
                                          "\"");
  value_ = it->second;
  isset_ = true;
  return base::Result();
}

StringFlag::StringFlag(std::string name, std::string default_value,
                       std::string help)
    : Flag(std::move(name), std::move(help)),
      default_(default_value),
      value_(std::move(default_value)),
      isset_(false) {
  add_alias(this->name());
}
void StringFlag::add_alias(const std::string& name) {
  auto f = [this](FlagSet*, bool, const std::string& value) {
    return set(value);
  };
  push_hook(name, FlagArgument::required, f);
}
bool StringFlag::is_set() const noexcept { return isset_; }
std::string StringFlag::get() const { return value_; }
std::string StringFlag::get_default() const { return default_; }
void StringFlag::reset() {
  value_ = default_;
  isset_ = false;
}
base::Result StringFlag::set(const std::string& value) {
  value_ = value;
  isset_ = true;
  return base::Result();
}

UintFlag::UintFlag(std::string name, uint64_t default_value, std::string help)
    : Flag(std::move(name), std::move(help)),
      default_(default_value),
      value_(default_value),
      isset_(false) {
  add_alias(this->name());
}
void UintFlag::add_alias(const std::string& name) {
  auto f = [this](FlagSet*, bool, const std::string& value) {
    return set(value);
  };
  push_hook(name, FlagArgument::required, f);
}
bool UintFlag::is_set() const noexcept { return isset_; }
std::string UintFlag::get() const { return std::to_string(value_); }
std::string UintFlag::get_default() const { return std::to_string(default_); }
void UintFlag::reset() {
  value_ = default_;
  isset_ = false;
}
base::Result UintFlag::set(const std::string& value) {
  if (value.empty() || value[0] == '-' || value[0] == '+')
    return base::Result::invalid_argument("invalid unsigned integer: \"",
                                          value, "\"");
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  auto n = ::strtoull(begin, &end, 0);
  if (errno == ERANGE)
    return base::Result::out_of_range("unsigned integer out of range: \"",
                                      value, "\"");
  if (end == begin || *end != '\0')
    return base::Result::invalid_argument("invalid unsigned integer: \"",
                                          value, "\"");
  value_ = n;
  isset_ = true;
  return base::Result();
}

DoubleFlag::DoubleFlag(std::string name, double default_value,
                       std::string help)
    : Flag(std::move(name), std::move(help)),
      default_(default_value),
      value_(default_value),
      isset_(false) {
  add_alias(this->name());
}
void DoubleFlag::add_alias(const std::string& name) {
  auto f = [this](FlagSet*, bool, const std::string& value) {
    return set(value);
  };
  push_hook(name, FlagArgument::required, f);
}
bool DoubleFlag::is_set() const noexcept { return isset_; }
std::string DoubleFlag::get() const {
  std::ostringstream o;
  o << value_;
  return o.str();
}
std::string DoubleFlag::get_default() const {
  std::ostringstream o;
  o << default_;
  return o.str();
}
void DoubleFlag::reset() {
  value_ = default_;
  isset_ = false;
}
base::Result DoubleFlag::set(const std::string& value) {
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  double d = ::strtod(begin, &end);
  if (errno == ERANGE)
    return base::Result::out_of_range("number out of range: \"", value, "\"");
  if (value.empty() || end == begin || *end != '\0')
    return base::Result::invalid_argument("invalid number: \"", value, "\"");
  value_ = d;
  isset_ = true;
  return base::Result();
}

FlagSet::FlagSet() : progname_("<program>"), usage_("<flags>") {}

void FlagSet::register_hook(FlagHook* hook) { hooks_[hook->name] = hook; }

Flag& FlagSet::add(std::unique_ptr<Flag> flag) {
  CHECK_NOTNULL(flag.get());
  Flag* ptr = flag.get();
  flags_.push_back(std::move(flag));
  names_[ptr->name()] = ptr;
  for (const auto& hook : ptr->hooks_) {
    register_hook(hook.get());
  }
  return *ptr;
}

Flag& FlagSet::add_help() { return add(std::unique_ptr<Flag>(new HelpFlag)); }

Flag& FlagSet::add_bool(std::string name, bool default_value,
                        std::string help) {
  return add(std::unique_ptr<Flag>(
      new BoolFlag(std::move(name), default_value, std::move(help))));
}

Flag& FlagSet::add_string(std::string name, std::string default_value,
                          std::string help) {
  return add(std::unique_ptr<Flag>(new StringFlag(
      std::move(name), std::move(default_value), std::move(help))));
}

Flag& FlagSet::add_uint(std::string name, uint64_t default_value,
                        std::string help) {
  return add(std::unique_ptr<Flag>(
      new UintFlag(std::move(name), default_value, std::move(help))));
}

Flag& FlagSet::add_double(std::string name, double default_value,
                          std::string help) {
  return add(std::unique_ptr<Flag>(
      new DoubleFlag(std::move(name), default_value, std::move(help))));
}

Flag* FlagSet::get(const std::string& name) const noexcept {
  auto it = names_.find(name);
  if (it != names_.end())
    return it->second;
  else
    return nullptr;
}

void FlagSet::show_help(std::ostream& o) {
  if (!description_.empty()) {
    o << description_ << "\n";
  }

  o << "Usage: " << progname_ << " " << usage_ << "\n\n";

  o << "Flags:\n";
  std::size_t longest = 0;
  for (const auto& flag : flags_) {
    auto n = flag->name().size();
    if (longest < n) longest = n;
  }
  for (const auto& flag : flags_) {
    o << "  --" << std::left << std::setw(longest) << flag->name() << "  "
      << flag->help();
    if (flag->is_required()) {
      o << " [required]\n";
    } else {
      auto def = flag->get_default();
      if (def.empty())
        o << "\n";
      else
        o << " [default: " << def << "]\n";
    }
  }
  o << std::endl;
}

void FlagSet::die(const std::string& msg) {
  std::cerr << "ERROR: " << msg << std::endl;
  exit(2);
}

base::Result FlagSet::try_parse(int argc, const char* const* argv) {
  if (argc > 0 && progname_ == "<program>") progname_ = argv[0];

  int i = 1;
  while (i < argc) {
    std::string arg(argv[i]);
    ++i;

    if (arg.empty() || arg[0] != '-' || arg == "-") {
      args_.push_back(std::move(arg));
      continue;
    }
    if (arg == "--") break;

    std::size_t skip = (arg.compare(0, 2, "--") == 0) ? 2 : 1;
    arg.erase(0, skip);

    std::string flag;
    std::string value;
    bool have_arg;
    auto index = arg.find('=');
    if (index == std::string::npos) {
      flag = arg;
      have_arg = false;
    } else {
      flag = arg.substr(0, index);
      value = arg.substr(index + 1);
      have_arg = true;
    }

    auto it = hooks_.find(flag);
    if (it == hooks_.end()) {
      return base::Result::invalid_argument("unknown flag: --", flag);
    }

    FlagHook& hook = *it->second;

    if (!have_arg && hook.arg == FlagArgument::required) {
      if (i >= argc) {
        return base::Result::invalid_argument(
            "missing required argument for flag --", flag);
      }
      have_arg = true;
      value = argv[i];
      ++i;
    }

    if (have_arg && hook.arg == FlagArgument::none) {
      return base::Result::invalid_argument("flag --", flag,
                                            " does not take an argument");
    }

    auto result = hook.setter(this, have_arg, value);
    if (!result) {
      return base::Result(result.code(), ::base::internal::stringify(
                                             "--", flag, ": ", result));
    }
  }
  while (i < argc) {
    args_.push_back(argv[i]);
    ++i;
  }

  for (const auto& flag : flags_) {
    if (flag->is_required() && !flag->is_set()) {
      return base::Result::invalid_argument("missing required flag --",
                                            flag->name());
    }
  }
  return base::Result();
}

void FlagSet::parse(int argc, const char* const* argv) {
  auto result = try_parse(argc, argv);
  if (!result) die(result.message());
}

}  // namespace base
