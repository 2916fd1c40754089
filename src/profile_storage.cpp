/**
 * @file profile_storage.cpp
 * @brief Реализация хранилища профилей
 */

#include "linkage/profile_storage.hpp"

#include <charconv>
#include <fstream>
#include <istream>
#include <ostream>
#include <system_error>

namespace linkage {

namespace {

constexpr std::string_view kHeaderPrefix = "#!linkage-profiles";
constexpr std::string_view kSupportedVersion = "1";

std::vector<std::string_view> split_tabs(std::string_view sv) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (;;) {
    auto pos = sv.find('\t', start);
    if (pos == std::string_view::npos) {
      out.push_back(sv.substr(start));
      break;
    }
    out.push_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

template <class T>
bool parse_number(std::string_view sv, T &value, int base = 10) {
  auto [ptr, ec] =
      std::from_chars(sv.data(), sv.data() + sv.size(), value, base);
  return ec == std::errc{} && ptr == sv.data() + sv.size() && !sv.empty();
}

/// TAB и переводы строк ломают формат: заменяем пробелом
std::string sanitize_field(const std::string &s) {
  std::string out = s;
  for (char &c : out) {
    if (c == '\t' || c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return out;
}

} // namespace

ProfilesLoadOutcome parse_profiles(std::istream &in) {
  ProfilesLoadOutcome out;
  std::string line;
  bool first_line = true;
  bool have_active = false;
  std::size_t active = 0;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string_view sv = line;

    if (first_line && sv.starts_with(kHeaderPrefix)) {
      first_line = false;
      std::string_view version = sv.substr(kHeaderPrefix.size());
      while (!version.empty() && version.front() == ' ') {
        version.remove_prefix(1);
      }
      if (version != kSupportedVersion) {
        out.result = LoadResult::UnsupportedVersion;
        out.error = "Unsupported profile store version '" +
                    std::string{version} + "'";
        return out;
      }
      continue;
    }

    if (sv.empty() || sv.front() == '#') {
      continue;
    }
    first_line = false;

    auto fields = split_tabs(sv);
    const std::string_view kind = fields[0];

    if (kind == "active" && fields.size() == 2) {
      if (parse_number(fields[1], active)) {
        have_active = true;
        continue;
      }
    } else if (kind == "profile" && fields.size() == 3 && !fields[1].empty()) {
      ProfileRecord rec;
      rec.name = std::string{fields[1]};
      rec.layout = std::string{fields[2]};
      out.records.push_back(std::move(rec));
      continue;
    } else if (kind == "stat" && fields.size() == 4 && !out.records.empty()) {
      std::uint32_t code = 0;
      LetterStat stat;
      if (parse_number(fields[1], code, 16) && code <= 0x10FFFF &&
          parse_number(fields[2], stat.clean) &&
          parse_number(fields[3], stat.dirty)) {
        out.records.back().stats[static_cast<Char>(code)] = stat;
        continue;
      }
    }

    ++out.skipped;
  }

  if (in.bad()) {
    out.result = LoadResult::IoError;
    out.error = "Read error in profile store";
    return out;
  }

  out.active = (have_active && active < out.records.size()) ? active : 0;
  out.result = LoadResult::Ok;
  return out;
}

ProfilesLoadOutcome load_profiles_checked(const std::filesystem::path &path) {
  std::ifstream file{path};
  if (!file.is_open()) {
    ProfilesLoadOutcome out;
    out.result = LoadResult::IoError;
    out.error = "Profile store not readable: " + path.string();
    return out;
  }

  ProfilesLoadOutcome out = parse_profiles(file);
  if (!out.error.empty()) {
    out.error += ": " + path.string();
  }
  return out;
}

void write_profiles(std::ostream &out,
                    const std::vector<ProfileRecord> &records,
                    std::size_t active) {
  out << kHeaderPrefix << ' ' << kSupportedVersion << '\n';
  out << "active\t" << active << '\n';

  char hex[16];
  for (const auto &rec : records) {
    out << "profile\t" << sanitize_field(rec.name) << '\t'
        << sanitize_field(rec.layout) << '\n';
    for (const auto &[c, s] : rec.stats) {
      auto [ptr, ec] = std::to_chars(hex, hex + sizeof(hex),
                                     static_cast<std::uint32_t>(c), 16);
      (void)ec; // буфера заведомо хватает на U+10FFFF
      out << "stat\t" << std::string_view{hex, static_cast<std::size_t>(ptr - hex)}
          << '\t' << s.clean << '\t' << s.dirty << '\n';
    }
  }
}

StorageResult save_profiles(const std::filesystem::path &path,
                            const std::vector<ProfileRecord> &records,
                            std::size_t active) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return StorageResult::IoError;
    }
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream file{tmp, std::ios::trunc};
    if (!file.is_open()) {
      return StorageResult::IoError;
    }
    write_profiles(file, records, active);
    file.flush();
    if (!file) {
      return StorageResult::IoError;
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return StorageResult::IoError;
  }
  return StorageResult::Ok;
}

} // namespace linkage
