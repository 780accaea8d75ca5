#include <gtest/gtest.h>
#include "daemon/daemon.hpp"
#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <csignal>
#include <cstring>
#include <thread>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

class DaemonIPCTest : public ::testing::Test {
protected:
    std::string temp_dir_;
    Config config_;

    void SetUp() override {
        temp_dir_ = "/tmp/pw_d_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);
        // Explicit socket path, so the tests also work as root
        config_.data().socket_path = socket_path();
        config_.data().stop_timeout_ms = 2000;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    std::string socket_path() {
        return temp_dir_ + "/procwarden.sock";
    }

    void configure(const std::vector<std::string>& command, bool always_restart = false) {
        config_.data().program.name = "ipc-test";
        config_.data().program.command = command;
        config_.data().program.always_restart = always_restart;
    }

    bool wait_for_socket(int timeout_ms = 5000) {
        int waited = 0;
        while (waited < timeout_ms) {
            if (fs::exists(socket_path())) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            waited += 50;
        }
        return false;
    }

    json send_ipc(const json& cmd) {
        return send_raw(cmd.dump());
    }

    json send_raw(const std::string& line) {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) return json();

        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::string path = socket_path();
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(fd);
            return json();
        }

        // Set read timeout
        struct timeval tv;
        tv.tv_sec = 10;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string msg = line + "\n";
        if (write(fd, msg.data(), msg.size()) != (ssize_t)msg.size()) {
            close(fd);
            return json();
        }

        // Read response
        std::string buf;
        char c;
        while (read(fd, &c, 1) == 1) {
            if (c == '\n') break;
            buf += c;
        }
        close(fd);

        if (buf.empty()) return json();
        try {
            return json::parse(buf);
        } catch (const json::parse_error&) {
            return json();
        }
    }
};

TEST_F(DaemonIPCTest, StatusUnconfigured) {
    Daemon daemon(config_);
    EXPECT_EQ(daemon.process(), nullptr);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "status"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_TRUE(resp.value("ok", false));
    EXPECT_FALSE(resp["data"].value("configured", true));

    resp = send_ipc({{"cmd", "start"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_TRUE(resp.contains("error"));

    daemon.request_stop();
    t.join();
    EXPECT_FALSE(fs::exists(socket_path()));
}

TEST_F(DaemonIPCTest, StatusRunningThenKill) {
    configure({"sleep", "60"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "status"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_TRUE(resp.value("ok", false));
    auto data = resp["data"];
    EXPECT_TRUE(data.value("configured", false));
    EXPECT_EQ(data.value("name", ""), "ipc-test");
    EXPECT_EQ(data.value("state", ""), "running");
    EXPECT_TRUE(data.value("running", false));
    EXPECT_GT(data.value("pid", -1), 0);
    EXPECT_TRUE(data["returncode"].is_null());

    resp = send_ipc({{"cmd", "kill"}});
    EXPECT_TRUE(resp.value("ok", false));

    resp = send_ipc({{"cmd", "status"}});
    EXPECT_EQ(resp["data"].value("state", ""), "killed");
    EXPECT_FALSE(resp["data"].value("running", true));
    EXPECT_EQ(resp["data"].value("returncode", 0), -SIGKILL);

    // Killed is terminal
    for (const char* cmd : {"start", "terminate", "kill"}) {
        resp = send_ipc({{"cmd", cmd}});
        ASSERT_FALSE(resp.empty());
        EXPECT_FALSE(resp.value("ok", true)) << cmd;
        EXPECT_NE(resp.value("error", "").find("killed"), std::string::npos) << cmd;
    }

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, TerminateCommand) {
    configure({"sleep", "60"}, true);
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "terminate"}});
    EXPECT_TRUE(resp.value("ok", false));
    ASSERT_NE(daemon.process(), nullptr);
    EXPECT_EQ(daemon.process()->state(), ProcessState::Killed);
    EXPECT_EQ(*daemon.process()->returncode(), -SIGTERM);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, TerminateEscalatesAfterTimeout) {
    configure({"sh", "-c", "trap '' TERM; sleep 2"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());
    // Let the shell install its trap
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto resp = send_ipc({{"cmd", "terminate"}, {"timeout_ms", 300}});
    EXPECT_TRUE(resp.value("ok", false));
    EXPECT_EQ(*daemon.process()->returncode(), -SIGKILL);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, KillEscalatesPendingTerminate) {
    configure({"sh", "-c", "trap '' TERM; sleep 5"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // A long grace period: the terminate stays pending until the kill below
    json term_resp;
    std::thread stopper([&]() {
        term_resp = send_ipc({{"cmd", "terminate"}, {"timeout_ms", 60000}});
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto start = std::chrono::steady_clock::now();
    auto resp = send_ipc({{"cmd", "kill"}});
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(resp.value("ok", false));
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    stopper.join();
    EXPECT_TRUE(term_resp.value("ok", false));
    EXPECT_EQ(daemon.process()->state(), ProcessState::Killed);
    EXPECT_EQ(*daemon.process()->returncode(), -SIGKILL);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, SilentClientDoesNotBlockOthers) {
    configure({"sleep", "60"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    // Connects and never sends its request line
    int idle = socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(idle, 0);
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path().c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(connect(idle, (struct sockaddr*)&addr, sizeof(addr)), 0);

    auto start = std::chrono::steady_clock::now();
    auto resp = send_ipc({{"cmd", "status"}});
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(resp.value("ok", false));
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    // The daemon gives up on the idle client and closes it
    char c;
    EXPECT_EQ(read(idle, &c, 1), 0);
    close(idle);

    daemon.request_stop();
    t.join();
}

TEST(DaemonClientTest, ResponseTimeoutCoversStopTimeout) {
    EXPECT_GT(DaemonClient::response_timeout_ms(0), 0);
    EXPECT_GT(DaemonClient::response_timeout_ms(5000), 5000);
    EXPECT_GT(DaemonClient::response_timeout_ms(10 * 60 * 1000), 10 * 60 * 1000);
    EXPECT_GT(DaemonClient::response_timeout_ms(kMaxDurationMs), kMaxDurationMs);
    // Out-of-range requests are bounded the way the daemon bounds them
    EXPECT_EQ(DaemonClient::response_timeout_ms(kMaxDurationMs + 1),
              DaemonClient::response_timeout_ms(kMaxDurationMs));
}

TEST_F(DaemonIPCTest, StartWithoutAutostart) {
    configure({"sh", "-c", "exit 4"});
    config_.data().autostart = false;
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "status"}});
    EXPECT_EQ(resp["data"].value("state", ""), "not_started");

    resp = send_ipc({{"cmd", "start"}});
    EXPECT_TRUE(resp.value("ok", false));

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    resp = send_ipc({{"cmd", "status"}});
    EXPECT_EQ(resp["data"].value("state", ""), "exited");
    EXPECT_EQ(resp["data"].value("returncode", 0), 4);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, StartSpawnErrorIsReported) {
    configure({"/nonexistent/binary"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "start"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_NE(resp.value("error", "").find("/nonexistent/binary"), std::string::npos);

    resp = send_ipc({{"cmd", "status"}});
    EXPECT_EQ(resp["data"].value("state", ""), "not_started");

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, UnknownCommand) {
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "nonexistent_cmd"}});
    EXPECT_FALSE(resp.empty());
    if (!resp.empty()) {
        EXPECT_FALSE(resp.value("ok", true));
        EXPECT_TRUE(resp.contains("error"));
    }

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, MalformedJson) {
    Daemon daemon(config_);
    auto resp = json::parse(daemon.handle_command("{not json"));
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_NE(resp.value("error", "").find("Parse error"), std::string::npos);
}

TEST_F(DaemonIPCTest, ShutdownStopsProcess) {
    configure({"sleep", "60"}, true);
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());
    ASSERT_TRUE(daemon.process()->running());
    pid_t pid = daemon.process()->pid();

    daemon.request_stop();
    t.join();

    EXPECT_EQ(daemon.process()->state(), ProcessState::Killed);
    EXPECT_EQ(::kill(pid, 0), -1);
}

TEST_F(DaemonIPCTest, ClientRoundTrip) {
    configure({"sleep", "60"});
    Daemon daemon(config_);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    DaemonClient client(socket_path());

    DaemonClient::DaemonStatus st;
    std::string err;
    ASSERT_TRUE(client.get_status(st, err)) << err;
    EXPECT_TRUE(st.configured);
    EXPECT_EQ(st.name, "ipc-test");
    EXPECT_EQ(st.command, (std::vector<std::string>{"sleep", "60"}));
    EXPECT_EQ(st.state, "running");
    EXPECT_TRUE(st.running);
    EXPECT_FALSE(st.returncode.has_value());

    EXPECT_TRUE(client.start(err));  // already running: no-op
    EXPECT_TRUE(client.terminate(err, 1000)) << err;

    ASSERT_TRUE(client.get_status(st, err));
    EXPECT_EQ(st.state, "killed");
    ASSERT_TRUE(st.returncode.has_value());
    EXPECT_EQ(*st.returncode, -SIGTERM);

    EXPECT_FALSE(client.kill(err));
    EXPECT_FALSE(err.empty());

    daemon.request_stop();
    t.join();
}

TEST(DaemonClientTest, NoDaemon) {
    DaemonClient client("/tmp/pw_no_daemon_" + std::to_string(::getpid()) + ".sock");
    std::string err;
    EXPECT_FALSE(client.start(err));
    EXPECT_EQ(err, "Cannot connect to daemon");

    DaemonClient::DaemonStatus st;
    EXPECT_FALSE(client.get_status(st, err));
}
