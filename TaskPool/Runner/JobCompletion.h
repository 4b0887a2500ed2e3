#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace taskpool {

    // Receiver of job outcomes. Implemented by the run that launched the job.
    template <class Result>
    class CompletionSink {
    public:
        virtual ~CompletionSink() = default;
        virtual void job_succeeded(size_t index, Result result) = 0;
        virtual void job_failed(size_t index, std::exception_ptr error) = 0;
    };

    // Handed to a job when it is launched; the job settles it exactly once, from
    // any thread, whenever its work is done. Copies share the settled flag.
    template <class Result>
    class JobCompletion {
    public:
        JobCompletion(std::shared_ptr<CompletionSink<Result>> sink, size_t index)
            : sink_(std::move(sink)), index_(index), settled_(std::make_shared<std::atomic<bool>>(false)) {}

        size_t index() const { return index_; }
        bool settled() const { return settled_->load(); }

        void resolve(Result result) const {
            claim();
            sink_->job_succeeded(index_, std::move(result));
        }

        void reject(std::exception_ptr error) const {
            claim();
            sink_->job_failed(index_, std::move(error));
        }

        void reject(const std::string& message) const {
            reject(std::make_exception_ptr(std::runtime_error(message)));
        }

        // Used by the launcher when the job function itself throws; a job that
        // already settled keeps its outcome.
        bool reject_if_unsettled(std::exception_ptr error) const {
            if (settled_->exchange(true)) return false;
            sink_->job_failed(index_, std::move(error));
            return true;
        }

    private:
        void claim() const {
            if (settled_->exchange(true))
                throw std::logic_error("job " + std::to_string(index_) + " settled more than once");
        }

        std::shared_ptr<CompletionSink<Result>> sink_;
        size_t index_;
        std::shared_ptr<std::atomic<bool>> settled_;
    };

} // namespace taskpool
