#include "pg_pool.hpp"

namespace jobclaim::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      // dropped by the server; replace it below
      --live_connections_;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("lease_messages",
               "UPDATE messages SET visibility_deadline_ms=$1, read_count=read_count+1 "
               "WHERE msg_id IN (SELECT msg_id FROM messages WHERE queue_name=$2 AND visibility_deadline_ms<=$3 "
               "ORDER BY msg_id LIMIT $4 FOR UPDATE SKIP LOCKED) "
               "RETURNING msg_id,queue_name,payload,enqueued_at_ms,read_count,visibility_deadline_ms");

  conn.prepare("claim_processed_job",
               "INSERT INTO processed_jobs(idempotency_key,job_id,queue_name,worker_id,status,attempts,result,last_error,"
               "created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,'processing',1,'','',$5,$5) "
               "ON CONFLICT(idempotency_key) DO UPDATE SET job_id=EXCLUDED.job_id, queue_name=EXCLUDED.queue_name, "
               "worker_id=EXCLUDED.worker_id, status='processing', attempts=processed_jobs.attempts+1, "
               "updated_at_ms=EXCLUDED.updated_at_ms "
               "WHERE processed_jobs.status='failed' OR "
               "(processed_jobs.status='processing' AND processed_jobs.job_id=EXCLUDED.job_id) "
               "RETURNING idempotency_key,job_id,queue_name,worker_id,status,attempts,result,last_error,created_at_ms,updated_at_ms,"
               "(xmax = 0) AS inserted");

  conn.prepare("delete_message", "DELETE FROM messages WHERE queue_name=$1 AND msg_id=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace jobclaim::db::postgres
