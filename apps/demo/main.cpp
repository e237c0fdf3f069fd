#include "cachify/cachify.hpp"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using cachify::Task;

namespace {

struct User {
  std::int64_t id{0};
  std::string name;
  std::string email;
};

cachify::Value to_value(const User &u) {
  return cachify::Value(cachify::Value::Object{
      {"id", u.id}, {"name", u.name}, {"email", u.email}});
}

bool from_value(const cachify::Value &v, User &out) {
  const auto *id = v.find("id");
  const auto *name = v.find("name");
  const auto *email = v.find("email");
  if (!id || !id->is_int() || !name || !name->is_string() || !email ||
      !email->is_string())
    return false;
  out.id = id->as_int();
  out.name = name->as_string();
  out.email = email->as_string();
  return true;
}

struct UpdateResult {
  std::string status;
  std::optional<User> user;
};

// Stand-in for the service's database; every query takes a little while.
class UserTable {
public:
  explicit UserTable(cachify::EventLoop &loop) : loop_(loop) {}

  Task<User> insert(std::string name, std::string email) {
    co_await loop_.sleep_for(latency_);
    User u{next_id_++, std::move(name), std::move(email)};
    rows_[u.id] = u;
    ++queries_;
    co_return u;
  }

  Task<std::optional<User>> find(std::int64_t id) {
    co_await loop_.sleep_for(latency_);
    ++queries_;
    auto it = rows_.find(id);
    if (it == rows_.end())
      co_return std::nullopt;
    co_return it->second;
  }

  Task<void> update(const User &u) {
    co_await loop_.sleep_for(latency_ * 4);
    ++queries_;
    rows_[u.id] = u;
  }

  std::uint64_t queries() const { return queries_; }

private:
  cachify::EventLoop &loop_;
  cachify::Duration latency_{std::chrono::milliseconds(50)};
  std::map<std::int64_t, User> rows_;
  std::int64_t next_id_{1};
  std::uint64_t queries_{0};
};

bool parse_id(const std::string &s, std::int64_t &out) {
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

std::string show(const std::optional<User> &u) {
  return u ? cachify::encode_json(to_value(*u)) : std::string("null");
}

Task<void> report_update(Task<UpdateResult> pending, std::string label) {
  UpdateResult r = co_await pending;
  std::cout << label << ": " << r.status;
  if (r.user)
    std::cout << " " << show(r.user);
  std::cout << "\n";
}

void usage() {
  std::cout << "commands:\n"
               "  post <name> <email>\n"
               "  get <id>\n"
               "  put <id> <name> <email>\n"
               "  race <id> <name> <email>   two concurrent updates\n"
               "  reset <id>\n"
               "  stats\n"
               "  quit\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string redis_url;
  std::string config_path;
  bool use_memory = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--redis-url" && i + 1 < argc)
      redis_url = argv[++i];
    else if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--memory")
      use_memory = true;
    else if (a == "--verbose")
      verbose = true;
    else {
      std::cerr << "usage: cachify_demo [--memory] [--redis-url URL] "
                   "[--config FILE] [--verbose]\n";
      return 2;
    }
  }

  cachify::Config cfg;
  if (!config_path.empty()) {
    std::string err;
    if (!cachify::load_config(config_path, cfg, &err)) {
      std::cerr << "config: " << err << "\n";
      return 1;
    }
  }
  if (!redis_url.empty())
    cfg.redis_url = redis_url;

  cachify::Context ctx(cfg);
  auto stats = std::make_shared<cachify::StatsListener>();
  ctx.add_listener(stats);
  if (verbose)
    ctx.add_listener(std::make_shared<cachify::LoggingListener>("demo"));

  cachify::EventLoop loop;
  cachify::WorkerPool pool(4);

  std::shared_ptr<cachify::MemoryStore> memory;
  if (use_memory) {
    memory = std::make_shared<cachify::MemoryStore>();
    ctx.init(memory, std::make_shared<cachify::InlineAsyncStore>(memory),
             &loop);
    std::cout << "store: in-process memory\n";
  } else {
    cachify::RedisConfig rcfg;
    std::string err;
    if (!cachify::parse_redis_url(cfg.redis_url, rcfg, &err)) {
      std::cerr << "redis url: " << err << "\n";
      return 1;
    }
    auto redis = std::make_shared<cachify::RedisStore>(rcfg);
    try {
      redis->ping();
    } catch (const cachify::StoreUnavailableError &e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
    ctx.init(redis,
             std::make_shared<cachify::OffloadAsyncStore>(redis, pool, loop),
             &loop);
    std::cout << "store: " << cfg.redis_url << "\n";
  }

  UserTable db(loop);

  auto read_user = cachify::cached(
      ctx, "read_user-{user_id}", {"user_id"},
      [&db](std::int64_t user_id) -> Task<std::optional<User>> {
        co_return co_await db.find(user_id);
      },
      cachify::CacheOptions{std::chrono::seconds(300), std::nullopt});

  auto update_user = cachify::once(
      ctx, "update-user-{user_id}", {"user_id", "new_user"},
      [&db, read_user](std::int64_t user_id,
                       User new_user) -> Task<UpdateResult> {
        auto current = co_await db.find(user_id);
        if (!current)
          co_return UpdateResult{"not found", std::nullopt};
        current->name = new_user.name;
        current->email = new_user.email;
        co_await db.update(*current);
        co_await read_user.reset(user_id);
        co_return UpdateResult{"updated", current};
      },
      cachify::return_on_contended(
          UpdateResult{"Update in progress", std::nullopt}));

  usage();
  std::string line;
  while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty())
      continue;
    if (cmd == "quit")
      break;

    try {
      std::string id_text, name, email;
      std::int64_t id = 0;
      if (cmd == "post" && in >> name >> email) {
        User u = loop.run_until_complete(db.insert(name, email));
        std::cout << show(u) << "\n";
      } else if (cmd == "get" && in >> id_text && parse_id(id_text, id)) {
        auto u = loop.run_until_complete(read_user(id));
        std::cout << show(u) << "\n";
      } else if (cmd == "put" && in >> id_text >> name >> email &&
                 parse_id(id_text, id)) {
        loop.run_until_complete(
            report_update(update_user(id, User{id, name, email}), "put"));
      } else if (cmd == "race" && in >> id_text >> name >> email &&
                 parse_id(id_text, id)) {
        loop.spawn(report_update(update_user(id, User{id, name, email}),
                                 "first"));
        loop.spawn(report_update(
            update_user(id, User{id, name + "-2", email}), "second"));
        loop.run();
      } else if (cmd == "reset" && in >> id_text && parse_id(id_text, id)) {
        loop.run_until_complete(read_user.reset(id));
        std::cout << "reset " << read_user.key(id) << "\n";
      } else if (cmd == "stats") {
        std::cout << "hits=" << stats->hits() << " misses=" << stats->misses()
                  << " store_errors=" << stats->store_errors()
                  << " locks=" << stats->locks_acquired()
                  << " contended=" << stats->locks_contended()
                  << " db_queries=" << db.queries() << "\n";
        if (memory)
          std::cout << "memory keys=" << memory->size() << "\n";
      } else {
        usage();
      }
    } catch (const cachify::Error &e) {
      std::cout << "error: " << e.what() << "\n";
    }
    if (memory)
      memory->tick();
  }

  pool.shutdown();
  ctx.teardown();
  return 0;
}
