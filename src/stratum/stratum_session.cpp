/**
 * @file stratum_session.cpp
 * @brief Реализация сессии с Grin stratum сервером
 */

#include "stratum_session.hpp"
#include "protocol.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <random>
#include <thread>

namespace strata::stratum {

namespace {

constexpr std::string_view COMPONENT = "stratum";

/// @brief Период проверки сокета и служебных таймеров потоком чтения
constexpr int READ_POLL_INTERVAL_MS = 50;

using Clock = std::chrono::steady_clock;

/**
 * @brief Подключиться к одному адресу с таймаутом
 */
Result<int> connect_with_timeout(const addrinfo& addr, std::chrono::milliseconds timeout) {
    int fd = ::socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol);
    if (fd < 0) {
        return Err<int>(ErrorCode::ConnectionFailed,
            std::format("Не удалось создать сокет: {}", std::strerror(errno)));
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr.ai_addr, addr.ai_addrlen);
    if (rc < 0 && errno != EINPROGRESS) {
        const int err = errno;
        ::close(fd);
        return Err<int>(ErrorCode::ConnectionFailed, std::strerror(err));
    }

    if (rc < 0) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc == 0) {
            ::close(fd);
            return Err<int>(ErrorCode::ConnectionTimeout,
                std::format("Таймаут подключения {} мс", timeout.count()));
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (rc < 0 || so_error != 0) {
            const int err = rc < 0 ? errno : so_error;
            ::close(fd);
            return Err<int>(ErrorCode::ConnectionFailed, std::strerror(err));
        }
    }

    ::fcntl(fd, F_SETFL, flags);

    // Установить TCP_NODELAY для минимальной латентности
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    // Ограничиваем блокирующую отправку, чтобы зависший сервер не держал сессию
    timeval send_timeout{};
    send_timeout.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    send_timeout.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout));

    return fd;
}

/**
 * @brief Разрешить имя и подключиться к первому доступному адресу
 */
Result<int> open_connection(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        return Err<int>(ErrorCode::ResolveFailed,
            std::format("Не удалось разрешить {}: {}", endpoint.host, ::gai_strerror(rc)));
    }

    Error last_error(ErrorCode::ConnectionFailed, "Нет адресов");
    for (addrinfo* addr = result; addr != nullptr; addr = addr->ai_next) {
        auto fd = connect_with_timeout(*addr, timeout);
        if (fd) {
            ::freeaddrinfo(result);
            return fd;
        }
        last_error = fd.error();
    }

    ::freeaddrinfo(result);
    last_error.message = std::format("{}: {}", endpoint.to_string(), last_error.message);
    return std::unexpected(last_error);
}

} // namespace

// =============================================================================
// SessionConfig
// =============================================================================

Result<SessionConfig> SessionConfig::from(const MiningConfig& mining) {
    auto endpoint = Endpoint::parse(mining.stratum_server_addr);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }

    SessionConfig config;
    config.endpoint = std::move(*endpoint);
    config.login = mining.stratum_server_login;
    config.password = mining.stratum_server_password;
    config.connect_timeout = std::chrono::milliseconds(mining.connect_timeout_ms);
    config.keepalive_interval = std::chrono::milliseconds(mining.keepalive_interval_ms);
    config.request_timeout = std::chrono::milliseconds(mining.request_timeout_ms);
    config.reconnect_initial = std::chrono::milliseconds(mining.reconnect_initial_ms);
    config.reconnect_max = std::chrono::milliseconds(mining.reconnect_max_ms);
    config.submit_queue_size = mining.submit_queue_size;
    return config;
}

// =============================================================================
// Реализация StratumSession
// =============================================================================

struct StratumSession::Impl {
    SessionConfig config;
    log::Logger& logger;
    std::shared_ptr<EventSignal> event_signal;

    std::atomic<bool> running{false};
    std::atomic<uint64_t> next_id{1};

    // Потоки
    std::thread reader;
    std::thread supervisor;

    // Всё ниже защищено mutex
    mutable std::mutex mutex;
    std::condition_variable state_cv;

    SessionState state = SessionState::Disconnected;
    bool supervising = false;
    bool ever_connected = false;
    int socket_fd = -1;

    /// @brief Поколение подключения: устаревшие потоки чтения его не совпадут
    uint64_t generation = 0;

    // Таблица ожидающих ответа запросов
    struct PendingRequest {
        std::string method;
        Clock::time_point sent_at;
    };
    std::map<RequestHandle, PendingRequest> outstanding;

    // Решения, ожидающие подключения
    struct QueuedSubmission {
        RequestHandle handle;
        mining::Solution solution;
    };
    std::deque<QueuedSubmission> submit_queue;

    std::deque<SessionEvent> events;

    // Ответ на login (его ждёт connect())
    std::optional<RequestHandle> login_handle;
    std::optional<Response> login_response;

    // Информация
    std::optional<Clock::time_point> connected_since;
    Clock::time_point last_sent_at;
    std::optional<std::chrono::system_clock::time_point> last_message_sent;
    std::optional<std::chrono::system_clock::time_point> last_message_received;
    uint64_t reconnects = 0;
    uint64_t dropped_submissions = 0;
    uint64_t malformed_lines = 0;
    std::chrono::milliseconds current_backoff{0};
    std::string last_error;

    std::mt19937 rng{std::random_device{}()};

    Impl(SessionConfig cfg, log::Logger& log, std::shared_ptr<EventSignal> signal)
        : config(std::move(cfg))
        , logger(log)
        , event_signal(std::move(signal)) {}

    // =========================================================================
    // События
    // =========================================================================

    void push_event_locked(SessionEvent event) {
        events.push_back(std::move(event));
        if (event_signal) {
            event_signal->notify();
        }
    }

    // =========================================================================
    // Отправка
    // =========================================================================

    /**
     * @brief Отправить строку (вызывается под mutex)
     *
     * При ошибке сокет закрывается на запись и чтение: поток чтения
     * обнаружит обрыв и выполнит обычную обработку потери связи.
     */
    bool send_locked(const std::string& json) {
        if (socket_fd < 0) {
            return false;
        }

        std::string line = json + "\n";
        std::size_t offset = 0;
        while (offset < line.size()) {
            ssize_t sent = ::send(socket_fd, line.data() + offset, line.size() - offset,
                                  MSG_NOSIGNAL);
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            if (sent <= 0) {
                last_error = std::format("Ошибка отправки: {}", std::strerror(errno));
                logger.warn(COMPONENT, "{}", last_error);
                ::shutdown(socket_fd, SHUT_RDWR);
                return false;
            }
            offset += static_cast<std::size_t>(sent);
        }

        last_sent_at = Clock::now();
        last_message_sent = std::chrono::system_clock::now();
        logger.trace(COMPONENT, "-> {}", json);
        return true;
    }

    RequestHandle send_tracked_locked(std::string_view method, const std::string& json,
                                      RequestHandle id) {
        outstanding[id] = PendingRequest{std::string(method), Clock::now()};
        send_locked(json);
        return id;
    }

    void send_get_job_template_locked() {
        const RequestHandle id = next_id++;
        send_tracked_locked(method::GET_JOB_TEMPLATE, encode_get_job_template(id), id);
    }

    // =========================================================================
    // Обработка входящих строк
    // =========================================================================

    void handle_response_locked(Response response) {
        auto it = outstanding.find(response.id);
        if (it == outstanding.end()) {
            logger.debug(COMPONENT, "Ответ на неизвестный запрос id={}", response.id);
            return;
        }
        const std::string method_name = std::move(it->second.method);
        outstanding.erase(it);

        if (login_handle && *login_handle == response.id) {
            login_response = std::move(response);
            state_cv.notify_all();
            return;
        }

        if (method_name == method::KEEPALIVE) {
            push_event_locked(Heartbeat{});
            return;
        }

        if (method_name == method::GET_JOB_TEMPLATE) {
            if (!response.ok()) {
                logger.warn(COMPONENT, "getjobtemplate отклонён: {}", response.error->message);
                return;
            }
            auto job = parse_job(response.result);
            if (!job) {
                ++malformed_lines;
                logger.warn(COMPONENT, "Некорректное задание в ответе: {}", job.error().message);
                return;
            }
            push_event_locked(JobReceived{std::move(*job)});
            return;
        }

        ResponseReceived event{response.id, method_name, JsonValue()};
        if (response.ok()) {
            event.result = std::move(response.result);
        } else {
            const ErrorCode code = method_name == method::SUBMIT
                ? ErrorCode::SubmissionRejected
                : ErrorCode::ProtocolUnexpected;
            event.result = Err<JsonValue>(code, response.error->message);
        }
        push_event_locked(std::move(event));
    }

    void handle_line(std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex);
        last_message_received = std::chrono::system_clock::now();
        logger.trace(COMPONENT, "<- {}", line);

        auto message = parse_line(line);
        if (!message) {
            // Одна испорченная строка не должна рвать сессию
            ++malformed_lines;
            logger.warn(COMPONENT, "Строка пропущена ({}): {}",
                        message.error().message, line.substr(0, 200));
            return;
        }

        if (auto* notification = std::get_if<JobNotification>(&*message)) {
            push_event_locked(JobReceived{std::move(notification->job)});
        } else {
            handle_response_locked(std::get<Response>(std::move(*message)));
        }
    }

    /**
     * @brief Таймауты запросов и keepalive (под mutex)
     */
    void housekeeping_locked(Clock::time_point now) {
        for (auto it = outstanding.begin(); it != outstanding.end();) {
            if (login_handle && it->first == *login_handle) {
                ++it;
                continue;
            }
            if (now - it->second.sent_at < config.request_timeout) {
                ++it;
                continue;
            }

            logger.warn(COMPONENT, "Нет ответа на {} (id={}) за {} мс",
                        it->second.method, it->first, config.request_timeout.count());
            if (it->second.method != method::KEEPALIVE &&
                it->second.method != method::GET_JOB_TEMPLATE) {
                push_event_locked(ResponseReceived{it->first, it->second.method,
                    Err<JsonValue>(ErrorCode::RequestTimeout,
                        std::format("Нет ответа за {} мс", config.request_timeout.count()))});
            }
            it = outstanding.erase(it);
        }

        if (state == SessionState::Ready && config.keepalive_interval.count() > 0 &&
            now - last_sent_at >= config.keepalive_interval) {
            const RequestHandle id = next_id++;
            send_tracked_locked(method::KEEPALIVE, encode_keepalive(id), id);
        }
    }

    // =========================================================================
    // Потеря связи
    // =========================================================================

    /**
     * @brief Обработать закрытие подключения поколения gen
     */
    void handle_disconnect(uint64_t gen, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex);
        if (gen != generation || socket_fd < 0) {
            return;
        }

        const bool was_ready = state == SessionState::Ready;
        socket_fd = -1;
        ++generation;
        connected_since.reset();
        last_error = reason;

        if (was_ready) {
            // Отправленные решения не переотправляются: сервер мог их принять
            for (const auto& [id, request] : outstanding) {
                if (request.method == method::SUBMIT) {
                    push_event_locked(ResponseReceived{id, request.method,
                        Err<JsonValue>(ErrorCode::SubmissionUnanswered,
                            "Подключение потеряно до получения ответа")});
                }
            }
            push_event_locked(ConnectionLost{reason});
            logger.warn(COMPONENT, "Подключение к {} потеряно: {}",
                        config.endpoint.to_string(), reason);
        }
        outstanding.clear();

        state = (running && supervising) ? SessionState::Reconnecting
                                         : SessionState::Disconnected;
        state_cv.notify_all();
    }

    void read_loop(int fd, uint64_t gen) {
        std::string buffer;
        char chunk[4096];
        std::string reason = "соединение закрыто сервером";

        while (running) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, READ_POLL_INTERVAL_MS);
            if (rc < 0) {
                if (errno == EINTR) continue;
                reason = std::format("poll: {}", std::strerror(errno));
                break;
            }

            if (rc > 0) {
                ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) {
                    if (n < 0) {
                        reason = std::format("recv: {}", std::strerror(errno));
                    }
                    break;
                }
                buffer.append(chunk, static_cast<std::size_t>(n));

                std::size_t pos;
                while ((pos = buffer.find('\n')) != std::string::npos) {
                    handle_line(std::string_view(buffer).substr(0, pos));
                    buffer.erase(0, pos + 1);
                }

                if (buffer.size() > constants::MAX_LINE_LENGTH) {
                    std::lock_guard<std::mutex> lock(mutex);
                    ++malformed_lines;
                    logger.warn(COMPONENT, "Строка длиннее {} байт отброшена",
                                constants::MAX_LINE_LENGTH);
                    buffer.clear();
                }
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                if (gen != generation) {
                    break;
                }
                housekeeping_locked(Clock::now());
            }
        }

        if (!running) {
            reason = "сессия остановлена";
        }
        handle_disconnect(gen, reason);
        ::close(fd);
    }

    // =========================================================================
    // Подключение
    // =========================================================================

    void join_reader() {
        if (reader.joinable() && reader.get_id() != std::this_thread::get_id()) {
            reader.join();
        }
    }

    /**
     * @brief Разорвать текущее подключение и дождаться потока чтения
     */
    void abort_connection() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (socket_fd >= 0) {
                ::shutdown(socket_fd, SHUT_RDWR);
            }
        }
        join_reader();
    }

    Result<void> connect_once() {
        bool reconnect = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == SessionState::Ready) {
                return {};
            }
            state = SessionState::Connecting;
            reconnect = ever_connected;
        }

        // Предыдущий поток чтения уже завершается: сокет закрыт
        join_reader();

        logger.info(COMPONENT, "Подключение к {}", config.endpoint.to_string());
        auto fd = open_connection(config.endpoint, config.connect_timeout);
        if (!fd) {
            std::lock_guard<std::mutex> lock(mutex);
            last_error = fd.error().message;
            state = supervising ? SessionState::Reconnecting : SessionState::Disconnected;
            return std::unexpected(fd.error());
        }

        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            socket_fd = *fd;
            gen = ++generation;
            last_sent_at = Clock::now();
            login_handle.reset();
            login_response.reset();
        }
        reader = std::thread([this, socket = *fd, gen] { read_loop(socket, gen); });

        if (config.login) {
            auto login = authenticate(gen);
            if (!login) {
                abort_connection();
                std::lock_guard<std::mutex> lock(mutex);
                last_error = login.error().message;
                state = supervising ? SessionState::Reconnecting : SessionState::Disconnected;
                return login;
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (gen != generation) {
            return Err<void>(ErrorCode::ConnectionClosed,
                std::format("Подключение к {} закрыто при установке", config.endpoint.to_string()));
        }

        state = SessionState::Ready;
        connected_since = Clock::now();
        current_backoff = std::chrono::milliseconds(0);
        ever_connected = true;
        if (reconnect) {
            ++reconnects;
        }

        // Сначала решения, накопленные за время без связи, по порядку
        if (!submit_queue.empty()) {
            logger.info(COMPONENT, "Отправка {} решений из очереди", submit_queue.size());
        }
        while (!submit_queue.empty()) {
            auto queued = std::move(submit_queue.front());
            submit_queue.pop_front();
            send_tracked_locked(method::SUBMIT, encode_submit(queued.handle, queued.solution),
                                queued.handle);
        }

        send_get_job_template_locked();
        push_event_locked(Connected{reconnect});
        logger.info(COMPONENT, "Подключено к {}", config.endpoint.to_string());
        return {};
    }

    Result<void> authenticate(uint64_t gen) {
        std::unique_lock<std::mutex> lock(mutex);
        state = SessionState::Authenticating;

        const RequestHandle id = next_id++;
        login_handle = id;
        send_tracked_locked(method::LOGIN,
            encode_login(id, *config.login, config.password.value_or(""), config.agent), id);

        bool answered = state_cv.wait_for(lock, config.request_timeout, [&] {
            return login_response.has_value() || gen != generation || !running;
        });

        login_handle.reset();
        if (!answered || !login_response) {
            if (gen != generation) {
                return Err<void>(ErrorCode::ConnectionClosed, "Подключение закрыто во время login");
            }
            return Err<void>(ErrorCode::RequestTimeout,
                std::format("Нет ответа на login за {} мс", config.request_timeout.count()));
        }

        if (!login_response->ok()) {
            return Err<void>(ErrorCode::LoginRejected,
                std::format("Login отклонён: {}", login_response->error->message));
        }
        return {};
    }

    /// @brief Задержка с разбросом +-20%, не больше reconnect_max
    std::chrono::milliseconds jittered(std::chrono::milliseconds delay) {
        std::uniform_real_distribution<double> jitter(0.8, 1.2);
        auto wait = std::chrono::milliseconds(
            static_cast<int64_t>(static_cast<double>(delay.count()) * jitter(rng)));
        return std::min(wait, config.reconnect_max);
    }

    /**
     * @brief Выждать задержку переподключения
     *
     * @return false если сессия остановлена во время ожидания
     */
    bool wait_backoff(std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex);
        current_backoff = wait;
        state = SessionState::Reconnecting;
        state_cv.wait_for(lock, wait, [this] { return !running.load(); });
        return running;
    }

    void supervise_loop() {
        auto delay = config.reconnect_initial;

        // Момент перехода в Ready для подключения, установленного этим циклом
        // или до его запуска; после потери такого подключения нужна пауза
        std::optional<Clock::time_point> ready_since;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == SessionState::Ready) {
                ready_since = connected_since.value_or(Clock::now());
            }
        }

        while (running) {
            {
                std::unique_lock<std::mutex> lock(mutex);
                state_cv.wait(lock, [this] {
                    return !running || state != SessionState::Ready;
                });
            }
            if (!running) break;

            if (ready_since) {
                if (Clock::now() - *ready_since >= config.stable_period) {
                    delay = config.reconnect_initial;
                }
                ready_since.reset();

                const auto wait = jittered(delay);
                logger.info(COMPONENT, "Переподключение к {} через {} мс",
                            config.endpoint.to_string(), wait.count());
                if (!wait_backoff(wait)) break;
                delay = std::min(delay * 2, config.reconnect_max);
            }

            auto result = connect_once();
            if (result) {
                ready_since = Clock::now();
                continue;
            }

            const auto wait = jittered(delay);
            logger.warn(COMPONENT, "{}. Повтор через {} мс", result.error().message, wait.count());
            if (!wait_backoff(wait)) break;
            delay = std::min(delay * 2, config.reconnect_max);
        }
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StratumSession::StratumSession(SessionConfig config, log::Logger& logger,
                               std::shared_ptr<EventSignal> event_signal)
    : impl_(std::make_unique<Impl>(std::move(config), logger, std::move(event_signal))) {}

StratumSession::~StratumSession() {
    shutdown();
}

Result<void> StratumSession::connect() {
    impl_->running = true;
    return impl_->connect_once();
}

Result<void> StratumSession::connect(std::string_view address) {
    auto endpoint = Endpoint::parse(address);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state == SessionState::Ready && !(impl_->config.endpoint == *endpoint)) {
            return Err<void>(ErrorCode::ProtocolUnexpected,
                std::format("Сессия уже подключена к {}", impl_->config.endpoint.to_string()));
        }
        impl_->config.endpoint = std::move(*endpoint);
    }
    return connect();
}

void StratumSession::start() {
    if (impl_->supervisor.joinable()) {
        return;
    }
    impl_->running = true;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->supervising = true;
    }
    impl_->supervisor = std::thread([this] { impl_->supervise_loop(); });
}

void StratumSession::shutdown() {
    impl_->running = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->supervising = false;
        if (impl_->socket_fd >= 0) {
            ::shutdown(impl_->socket_fd, SHUT_RDWR);
        }
    }
    impl_->state_cv.notify_all();

    if (impl_->supervisor.joinable()) {
        impl_->supervisor.join();
    }
    impl_->join_reader();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->state = SessionState::Disconnected;
    impl_->current_backoff = std::chrono::milliseconds(0);
}

RequestHandle StratumSession::send_request(std::string_view method_name, JsonValue params) {
    const RequestHandle id = impl_->next_id++;
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->state != SessionState::Ready) {
        impl_->push_event_locked(ResponseReceived{id, std::string(method_name),
            Err<JsonValue>(ErrorCode::ConnectionClosed, "Сессия не подключена")});
        return id;
    }

    impl_->send_tracked_locked(method_name, encode_request(id, method_name, params), id);
    return id;
}

RequestHandle StratumSession::submit_solution(const mining::Solution& solution) {
    const RequestHandle id = impl_->next_id++;
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->state == SessionState::Ready) {
        impl_->send_tracked_locked(method::SUBMIT, encode_submit(id, solution), id);
        return id;
    }

    impl_->submit_queue.push_back({id, solution});
    if (impl_->submit_queue.size() > impl_->config.submit_queue_size) {
        auto dropped = std::move(impl_->submit_queue.front());
        impl_->submit_queue.pop_front();
        ++impl_->dropped_submissions;
        impl_->logger.warn(COMPONENT, "Очередь отправки переполнена, решение для {} вытеснено",
                           dropped.solution.job_id);
        impl_->push_event_locked(ResponseReceived{dropped.handle, std::string(method::SUBMIT),
            Err<JsonValue>(ErrorCode::SubmissionUnanswered, "Вытеснено из очереди отправки")});
    }
    return id;
}

std::vector<SessionEvent> StratumSession::poll_events() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<SessionEvent> result;
    result.reserve(impl_->events.size());
    while (!impl_->events.empty()) {
        result.push_back(std::move(impl_->events.front()));
        impl_->events.pop_front();
    }
    return result;
}

std::optional<SessionEvent> StratumSession::next_event() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->events.empty()) {
        return std::nullopt;
    }
    SessionEvent event = std::move(impl_->events.front());
    impl_->events.pop_front();
    return event;
}

SessionState StratumSession::state() const noexcept {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

SessionInfo StratumSession::info() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SessionInfo info;
    info.state = impl_->state;
    info.endpoint = impl_->config.endpoint.to_string();
    info.connected_since = impl_->connected_since;
    info.reconnects = impl_->reconnects;
    info.current_backoff = impl_->current_backoff;
    info.last_message_sent = impl_->last_message_sent;
    info.last_message_received = impl_->last_message_received;
    info.outstanding_requests = impl_->outstanding.size();
    info.queued_submissions = impl_->submit_queue.size();
    info.dropped_submissions = impl_->dropped_submissions;
    info.malformed_lines = impl_->malformed_lines;
    info.last_error = impl_->last_error;
    return info;
}

} // namespace strata::stratum
