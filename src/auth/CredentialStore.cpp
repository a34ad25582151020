#include "auth/CredentialStore.h"

#include "core/Error.h"
#include "core/Logger.h"
#include "session/IDGenerator.hpp"

#include <boost/json.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace psmonitor::auth {

namespace {

// Writes `content` to `path` with owner-only permissions.
void write_private_file(const fs::path& path, const std::string& content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        throw std::runtime_error("cannot create " + path.string() + ": " + std::strerror(errno));
    }

    std::size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string err = std::strerror(errno);
            ::close(fd);
            throw std::runtime_error("cannot write " + path.string() + ": " + err);
        }
        written += static_cast<std::size_t>(n);
    }
    ::close(fd);
}

std::string field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) throw std::runtime_error(std::string("credentials: missing '") + key + "'");
    return json::value_to<std::string>(*v);
}

crypto::Bytes hex_field(const json::object& obj, const char* key) {
    auto bytes = crypto::from_hex(field(obj, key));
    if (!bytes) throw std::runtime_error(std::string("credentials: '") + key + "' is not hex");
    return *bytes;
}

Account parse_account(const std::string& text) {
    boost::system::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) throw std::runtime_error("credentials: " + ec.message());

    const json::object* obj = v.if_object();
    if (!obj) throw std::runtime_error("credentials: expected an object");

    Account a;
    a.id = field(*obj, "id");
    a.username = field(*obj, "username");
    a.salt = hex_field(*obj, "salt");
    a.hash = hex_field(*obj, "hash");

    const json::value* it = obj->if_contains("iterations");
    if (!it || !it->is_int64() || it->get_int64() <= 0) {
        throw std::runtime_error("credentials: bad 'iterations'");
    }
    a.iterations = static_cast<int>(it->get_int64());
    return a;
}

std::string serialize_account(const Account& a) {
    return json::serialize(json::object{
        {"id", a.id},
        {"username", a.username},
        {"salt", crypto::to_hex(a.salt)},
        {"hash", crypto::to_hex(a.hash)},
        {"iterations", a.iterations},
    });
}

} // namespace

Account CredentialStore::make_account(const std::string& username, const std::string& password, int iterations) {
    Account a;
    a.id = session::IDGenerator{}.accountID();
    a.username = username;
    a.salt = crypto::random_bytes(16);
    a.iterations = iterations;
    a.hash = crypto::pbkdf2_sha256(password, a.salt, iterations);
    return a;
}

CredentialStore CredentialStore::open(const std::string& data_dir, int iterations) {
    const fs::path dir(data_dir);
    const fs::path credentials = dir / "credentials.json";

    std::error_code fec;
    fs::create_directories(dir, fec);
    if (fec) throw std::runtime_error("cannot create " + dir.string() + ": " + fec.message());

    if (fs::exists(credentials)) {
        std::ifstream in(credentials);
        if (!in.is_open()) throw std::runtime_error("cannot read " + credentials.string());
        std::ostringstream text;
        text << in.rdbuf();

        PSM_LOG_DEBUG("[CredentialStore] loaded account from " << credentials.string());
        return CredentialStore(parse_account(text.str()));
    }

    const std::string password = crypto::base64url_encode(crypto::random_bytes(32));
    CredentialStore store(make_account(kDefaultUsername, password, iterations));

    write_private_file(dir / "psmonitor.secret", password + "\n");
    write_private_file(credentials, serialize_account(store.account_));
    store.generated_password_ = password;

    PSM_LOG_INFO("[CredentialStore] provisioned account '" << store.account_.username
                 << "', password stored in " << (dir / "psmonitor.secret").string());
    return store;
}

CredentialStore CredentialStore::with_password(const std::string& username,
                                               const std::string& password,
                                               int iterations) {
    return CredentialStore(make_account(username, password, iterations));
}

boost::system::error_code CredentialStore::authenticate(const std::string& username,
                                                        const std::string& password,
                                                        std::string& subject) const {
    // Hash even when the username is wrong so both failures cost the same.
    const auto hash = crypto::pbkdf2_sha256(password, account_.salt, account_.iterations, account_.hash.size());
    const bool password_ok = crypto::constant_time_equal(hash, account_.hash);

    if (username != account_.username || !password_ok) {
        return make_error_code(errc::invalid_credentials);
    }
    subject = account_.id;
    return {};
}

} // namespace psmonitor::auth
