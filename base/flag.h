// base/flag.h - Command-line flag parsing
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_FLAG_H
#define BASE_FLAG_H

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/result.h"

namespace base {

class FlagSet;  // forward declaration

enum class FlagArgument : unsigned char {
  none = 0,
  required = 1,
  optional = 2,
};

using FlagSetter =
    std::function<base::Result(FlagSet*, bool, const std::string&)>;

struct FlagHook {
  std::string name;
  FlagArgument arg;
  FlagSetter setter;

  FlagHook(std::string name, FlagArgument arg, FlagSetter setter)
      : name(std::move(name)), arg(arg), setter(std::move(setter)) {}
};

class Flag {
 protected:
  using HookVec = std::vector<std::unique_ptr<FlagHook>>;

  Flag(std::string name, std::string help);

  void push_hook(std::string name, FlagArgument arg, FlagSetter setter) {
    hooks_.emplace_back(
        new FlagHook(std::move(name), arg, std::move(setter)));
  }

 public:
  virtual ~Flag() noexcept = default;
  virtual void add_alias(const std::string& name) = 0;
  virtual bool is_set() const noexcept = 0;
  virtual std::string get() const = 0;
  virtual std::string get_default() const = 0;
  virtual void reset() = 0;
  virtual base::Result set(const std::string& value) = 0;

  const std::string& name() const noexcept { return name_; }
  const std::string& help() const noexcept { return help_; }
  bool is_required() const noexcept { return required_; }

  Flag& mark_required() noexcept {
    required_ = true;
    return *this;
  }
  Flag& alias(const std::string& name) {
    add_alias(name);
    return *this;
  }

 private:
  friend class FlagSet;

  std::string name_;
  std::string help_;
  HookVec hooks_;
  bool required_;
};

class HelpFlag : public Flag {
 public:
  HelpFlag();
  void add_alias(const std::string& name) override;
  bool is_set() const noexcept override;
  std::string get() const override;
  std::string get_default() const override;
  void reset() override;
  base::Result set(const std::string& value) override;
};

class BoolFlag : public Flag {
 public:
  BoolFlag(std::string name, bool default_value, std::string help);
  void add_alias(const std::string& name) override;
  bool is_set() const noexcept override;
  std::string get() const override;
  std::string get_default() const override;
  void reset() override;
  base::Result set(const std::string& value) override;

  bool value() const noexcept { return value_; }

 private:
  bool default_;
  bool value_;
  bool isset_;
};

class StringFlag : public Flag {
 public:
  StringFlag(std::string name, std::string default_value, std::string help);
  void add_alias(const std::string& name) override;
  bool is_set() const noexcept override;
  std::string get() const override;
  std::string get_default() const override;
  void reset() override;
  base::Result set(const std::string& value) override;

  const std::string& value() const noexcept { return value_; }

 private:
  std::string default_;
  std::string value_;
  bool isset_;
};

class UintFlag : public Flag {
 public:
  UintFlag(std::string name, uint64_t default_value, std::string help);
  void add_alias(const std::string& name) override;
  bool is_set() const noexcept override;
  std::string get() const override;
  std::string get_default() const override;
  void reset() override;
  base::Result set(const std::string& value) override;

  uint64_t value() const noexcept { return value_; }

 private:
  uint64_t default_;
  uint64_t value_;
  bool isset_;
};

class DoubleFlag : public Flag {
 public:
  DoubleFlag(std::string name, double default_value, std::string help);
  void add_alias(const std::string& name) override;
  bool is_set() const noexcept override;
  std::string get() const override;
  std::string get_default() const override;
  void reset() override;
  base::Result set(const std::string& value) override;

  double value() const noexcept { return value_; }

 private:
  double default_;
  double value_;
  bool isset_;
};

class FlagSet {
 public:
  FlagSet();

  Flag& add(std::unique_ptr<Flag> flag);
  Flag& add_help();
  Flag& add_bool(std::string name, bool default_value, std::string help);
  Flag& add_string(std::string name, std::string default_value,
                   std::string help);
  Flag& add_uint(std::string name, uint64_t default_value, std::string help);
  Flag& add_double(std::string name, double default_value, std::string help);

  void set_program_name(std::string progname) {
    progname_ = std::move(progname);
  }
  void set_description(std::string description) {
    description_ = std::move(description);
  }
  void set_usage(std::string usage) { usage_ = std::move(usage); }

  const std::string& program_name() const noexcept { return progname_; }
  const std::string& description() const noexcept { return description_; }
  const std::string& usage() const noexcept { return usage_; }

  Flag* get(const std::string& name) const noexcept;

  BoolFlag* get_bool(const std::string& name) const noexcept {
    return dynamic_cast<BoolFlag*>(get(name));
  }
  StringFlag* get_string(const std::string& name) const noexcept {
    return dynamic_cast<StringFlag*>(get(name));
  }
  UintFlag* get_uint(const std::string& name) const noexcept {
    return dynamic_cast<UintFlag*>(get(name));
  }
  DoubleFlag* get_double(const std::string& name) const noexcept {
    return dynamic_cast<DoubleFlag*>(get(name));
  }

  const std::vector<std::string>& args() const noexcept { return args_; }

  void show_help(std::ostream& o);

  // Parses argv, returning the first failure instead of exiting.
  base::Result try_parse(int argc, const char* const* argv);

  // Parses argv, calling die() on failure.
  void parse(int argc, const char* const* argv);

  [[noreturn]] void die(const std::string& msg);

  template <typename... Args>
  [[noreturn]] void die(const Args&... args) {
    die(::base::internal::stringify(args...));
  }

 private:
  void register_hook(FlagHook* hook);

  std::string progname_;
  std::string description_;
  std::string usage_;
  std::vector<std::unique_ptr<Flag>> flags_;
  std::map<std::string, Flag*> names_;
  std::map<std::string, FlagHook*> hooks_;
  std::vector<std::string> args_;
};

}  // namespace base

#endif  // BASE_FLAG_H
