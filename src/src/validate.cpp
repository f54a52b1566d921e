#include <av/validate.h>
#include <av/errors.h>
#include <av/log.h>
#include <av/pointer.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

namespace av {

namespace {
    std::shared_ptr<const FormatRegistry> builtin_formats() {
        static const auto registry = std::make_shared<const FormatRegistry>(FormatRegistry::with_builtins());
        return registry;
    }

    std::shared_ptr<const EvaluatorRegistry> builtin_evaluators() {
        static const auto registry = std::make_shared<const EvaluatorRegistry>(EvaluatorRegistry::with_builtins());
        return registry;
    }
}  // namespace

Validator::Validator(const SchemaDocument& doc, ValidationOptions options)
    : doc_(doc),
      options_(std::move(options)),
      resolver_(doc),
      formats_(options_.formats ? options_.formats : builtin_formats()),
      evaluators_(options_.evaluators ? options_.evaluators : builtin_evaluators()),
      trace_(std::getenv("AV_VALIDATE_DEBUG") != nullptr) {
    root_path_ = pointer::split(options_.schema_root);
    root_ = doc_.find(pointer::join(root_path_));
    if (root_ == kNoNode) throw Error("schema root '" + options_.schema_root + "' does not point to a schema");
    if (options_.max_depth > kMaxReferenceDepth)
        throw Error("max_depth " + std::to_string(options_.max_depth) + " exceeds the supported maximum of " +
                    std::to_string(kMaxReferenceDepth));
}

ValidationResult Validator::validate(const Value& instance) const {
    if (trace_) std::cerr << "validate debug: root='" << doc_.node(root_).pointer << "' data=" << preview(instance) << "\n";

    ResolutionContext resolution;
    EvalContext ctx{doc_, options_, resolver_, *evaluators_, *formats_, resolution, trace_};

    ValidationResult result;
    result.failures = evaluate_node(root_, instance, InstancePath{}, root_path_, ctx);
    log::debug("validated in " + std::to_string(resolution.steps) + " step(s), " +
               std::to_string(result.failures.size()) + " failure(s)");
    return result;
}

ValidationResult validate(const SchemaDocument& doc, const Value& instance, const ValidationOptions& options) {
    return Validator(doc, options).validate(instance);
}

std::vector<ValidationResult> validate_batch(const SchemaDocument& doc, const std::vector<Value>& instances,
                                             const ValidationOptions& options, unsigned workers) {
    Validator validator(doc, options);
    std::vector<ValidationResult> results(instances.size());
    if (instances.empty()) return results;

    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    workers = static_cast<unsigned>(std::min<std::size_t>(workers, instances.size()));

    std::atomic<std::size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto work = [&]() {
        while (true) {
            std::size_t i = next.fetch_add(1);
            if (i >= instances.size()) return;
            try {
                results[i] = validator.validate(instances[i]);
            } catch (const LimitExceeded& e) {
                Value details = Value::object();
                details["steps"] = static_cast<int64_t>(e.steps);
                details["max_steps"] = static_cast<int64_t>(options.max_steps);
                results[i].failures = {
                    make_failure(FailureKind::LimitExceeded, InstancePath{}, SchemaPath{}, e.what(), details)};
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                return;
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (unsigned w = 0; w < workers; ++w) pool.emplace_back(work);
    } catch (const std::system_error& e) {
        // keep going with the threads that did start
        log::warning(std::string("started ") + std::to_string(pool.size()) + " of " + std::to_string(workers) +
                     " batch workers: " + e.what());
        if (pool.empty()) work();
    }
    for (auto& t : pool) t.join();

    if (first_error) std::rethrow_exception(first_error);
    return results;
}

}  // namespace av
