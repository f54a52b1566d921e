#pragma once

#include <memory>
#include <vector>

#include <av/evaluators.h>
#include <av/failure.h>
#include <av/formats.h>
#include <av/options.h>
#include <av/resolver.h>
#include <av/schema.h>
#include <av/value.h>

namespace av {

// Validates instances against one schema of a compiled document. The
// document must outlive the validator. validate() is const and may be
// called from several threads at once.
class Validator {
  public:
    // Throws av::Error when options.schema_root does not name a schema.
    explicit Validator(const SchemaDocument& doc, ValidationOptions options = {});

    // Collects every failure. Throws LimitExceeded when options.max_steps
    // node evaluations are not enough.
    ValidationResult validate(const Value& instance) const;

    const ValidationOptions& options() const { return options_; }

  private:
    const SchemaDocument& doc_;
    ValidationOptions options_;
    NodeId root_ = kNoNode;
    SchemaPath root_path_;
    ReferenceResolver resolver_;
    std::shared_ptr<const FormatRegistry> formats_;
    std::shared_ptr<const EvaluatorRegistry> evaluators_;
    bool trace_ = false;
};

ValidationResult validate(const SchemaDocument& doc, const Value& instance, const ValidationOptions& options = {});

// Validates each instance on a pool of threads and returns the results in
// input order. An instance that runs out of steps gets a single
// limit-exceeded record. `workers` == 0 picks the hardware concurrency.
std::vector<ValidationResult> validate_batch(const SchemaDocument& doc, const std::vector<Value>& instances,
                                             const ValidationOptions& options = {}, unsigned workers = 0);

}  // namespace av
