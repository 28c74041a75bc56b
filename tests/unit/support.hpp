#ifndef ENCLAVE_TESTS_SUPPORT_HPP
#define ENCLAVE_TESTS_SUPPORT_HPP

#include <enclave/api/loader.hpp>
#include <enclave/common.hpp>
#include <enclave/config.hpp>
#include <enclave/descriptor.hpp>
#include <enclave/host.hpp>
#include <enclave/isolation.hpp>
#include <enclave/logging.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <system_error>
#include <thread>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <blackhole/handler.hpp>
#include <blackhole/root.hpp>

#include <fcntl.h>
#include <sys/stat.h>

namespace enclave { namespace testing {

namespace fs = boost::filesystem;

// Logger without handlers, every record is dropped.
inline
std::unique_ptr<logging::logger_t>
make_log() {
    return std::unique_ptr<logging::logger_t>(
        new blackhole::root_logger_t(std::vector<std::unique_ptr<blackhole::handler_t>>())
    );
}

inline
void
write(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());

    fs::ofstream stream(path, std::ios::out | std::ios::trunc);
    stream << content;
}

// Sets the modification time to now, as touch(1) does.
inline
void
touch(const fs::path& path) {
    if(::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0) {
        throw std::system_error(errno, std::system_category(), "unable to touch " + path.string());
    }
}

// Waits until the predicate holds or the timeout expires.
inline
bool
eventually(const std::function<bool()>& predicate,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while(std::chrono::steady_clock::now() < deadline) {
        if(predicate()) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return predicate();
}

// Temporary installation root, removed with everything inside on destruction.
class sandbox_t {
    const fs::path m_root;

public:
    sandbox_t():
        m_root(fs::temp_directory_path() / fs::unique_path("enclave-%%%%-%%%%-%%%%"))
    {
        fs::create_directories(m_root);
    }

   ~sandbox_t() {
        boost::system::error_code ec;
        fs::remove_all(m_root, ec);
    }

    const fs::path&
    root() const {
        return m_root;
    }

    fs::path
    app(const std::string& name) const {
        return m_root / "apps" / name;
    }

    fs::path
    domain(const std::string& name) const {
        return m_root / "domains" / name;
    }

    // Installs an application with a single JSON config resource and the given descriptor.
    void
    install(const std::string& name, const std::string& config, const std::string& descriptor = "") const {
        write(app(name) / "enclave-config.json", config);

        if(!descriptor.empty()) {
            write(app(name) / "enclave-deploy.json", descriptor);
        }
    }

    std::unique_ptr<host_t>
    host(std::chrono::milliseconds reload = std::chrono::milliseconds(3000),
         std::chrono::milliseconds anchor = std::chrono::milliseconds(1000)) const
    {
        const fs::path path = m_root / "enclave.json";

        write(path, format(
            "{{\"version\": 1, "
            "\"paths\": {{\"root\": \"{}\", \"plugins\": []}}, "
            "\"deploy\": {{\"reload-interval\": {}, \"anchor-interval\": {}}}}}",
            m_root.string(), reload.count(), anchor.count()
        ));

        return std::unique_ptr<host_t>(new host_t(make_config(path.string()), make_log()));
    }
};

// Loader decorator counting constructions and closes of application boundaries.
struct counters_t {
    counters_t():
        constructed(0),
        closed(0),
        concurrent(0),
        peak(0)
    { }

    std::atomic<int> constructed;
    std::atomic<int> closed;

    // Concurrent boundary constructions.
    std::atomic<int> concurrent;
    std::atomic<int> peak;
};

class counted_loader_t:
    public api::loader_t
{
    const api::loader_t::ptr_type m_inner;
    counters_t& m_counters;

public:
    counted_loader_t(api::loader_t::ptr_type inner, counters_t& counters):
        api::loader_t(nullptr),
        m_inner(std::move(inner)),
        m_counters(counters)
    {
        ++m_counters.constructed;
    }

    virtual
    std::string
    name() const {
        return m_inner->name();
    }

    virtual
    void
    close() {
        if(!m_inner->closed()) {
            ++m_counters.closed;
        }

        m_inner->close();
    }

    virtual
    bool
    closed() const {
        return m_inner->closed();
    }

protected:
    virtual
    boost::optional<boost::filesystem::path>
    find_resource(const std::string& name) const {
        return m_inner->resource(name);
    }

    virtual
    void*
    find_symbol(const std::string& name) const {
        return m_inner->symbol(name);
    }
};

class counted_isolation_t:
    public isolation_t
{
    counters_t& m_counters;
    const std::chrono::milliseconds m_delay;

public:
    counted_isolation_t(host_t& host, counters_t& counters,
                        std::chrono::milliseconds delay = std::chrono::milliseconds(0)):
        isolation_t(host),
        m_counters(counters),
        m_delay(delay)
    { }

    virtual
    api::loader_t::ptr_type
    make(const descriptor_t& descriptor) const {
        const int current = ++m_counters.concurrent;

        int peak = m_counters.peak;

        while(current > peak && !m_counters.peak.compare_exchange_weak(peak, current)) {
            // Retry.
        }

        std::this_thread::sleep_for(m_delay);

        auto loader = std::make_shared<counted_loader_t>(isolation_t::make(descriptor), m_counters);

        --m_counters.concurrent;

        return loader;
    }
};

}} // namespace enclave::testing

#endif
