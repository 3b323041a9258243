#include "cadence/executor/action_executor.hpp"

#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <format>

namespace cadence {

namespace {

using json = nlohmann::json;

auto fail_step(ExecutionLog& log, std::string_view prefix, ExecutionError error)
    -> std::unexpected<ExecutionError> {
  log.append(std::format("{}: {}", prefix, error.message));
  return std::unexpected{std::move(error)};
}

auto not_configured(ExecutionLog& log, std::string_view prefix,
                    std::string_view dependency)
    -> std::unexpected<ExecutionError> {
  return fail_step(log, prefix,
                   ExecutionError{make_error_code(Error::MissingDependency),
                                  std::format("{} not configured", dependency)});
}

auto check_budget(const ExecutionContext& ctx)
    -> std::optional<ExecutionError> {
  if (ctx.cancelled()) {
    return ExecutionError{make_error_code(Error::Cancelled),
                          "Execution cancelled"};
  }
  if (ctx.expired()) {
    return ExecutionError{make_error_code(Error::Timeout),
                          "Execution timed out"};
  }
  return std::nullopt;
}

}  // namespace

auto ExecutionLog::append(std::string line) -> void {
  log::debug("{}", line);
  lines_.push_back(std::move(line));
}

auto report_prompt(const json& config) -> std::string {
  return std::format(
      "Generate a comprehensive report based on this configuration:\n\n"
      "{}\n\n"
      "Please create a detailed, well-structured report with the following "
      "sections:\n"
      "1. Executive Summary\n"
      "2. Key Findings\n"
      "3. Detailed Analysis\n"
      "4. Recommendations\n"
      "5. Conclusion\n\n"
      "Format the report in Markdown.",
      config.dump(2));
}

ActionExecutor::ActionExecutor(Collaborators collaborators,
                               ActionDefaults defaults)
    : collaborators_(std::move(collaborators)), defaults_(std::move(defaults)) {
}

auto ActionExecutor::execute(const TaskAction& action, ExecutionLog& log,
                             const ExecutionContext& ctx) const
    -> Outcome<json> {
  if (auto stop = check_budget(ctx)) {
    return fail_step(log, std::format("{} not started", action.type_name()),
                     std::move(*stop));
  }

  // Collaborators are foreign code; nothing they throw may escape a dispatch.
  try {
    return std::visit(
        [&](const auto& a) -> Outcome<json> { return run(a, log, ctx); },
        action.kind);
  } catch (const std::exception& e) {
    return fail_step(log, std::format("{} failed", action.type_name()),
                     ExecutionError{make_error_code(Error::ExecutionFailed),
                                    e.what()});
  }
}

auto ActionExecutor::run(const AiPromptAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append("Executing AI prompt...");
  if (!collaborators_.llm) {
    return not_configured(log, "AI prompt failed", "LLM client");
  }

  auto model = action.model.value_or(defaults_.model);
  auto completion = collaborators_.llm->complete(
      {.model = model, .prompt = action.prompt, .max_tokens = defaults_.max_tokens},
      ctx.remaining());
  if (!completion) {
    return fail_step(log, "AI prompt failed", std::move(completion.error()));
  }

  auto text = completion->text.value_or("Non-text response received");
  log.append(std::format("AI response received ({} chars)", text.size()));

  return json{{"response", std::move(text)},
              {"model", std::move(model)},
              {"usage", completion->usage}};
}

auto ActionExecutor::run(const SendEmailAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append(std::format("Sending email to {}...", action.to));
  if (!collaborators_.email) {
    return not_configured(log, "Email send failed", "Email sender");
  }

  auto sent = collaborators_.email->send(
      {.to = action.to, .subject = action.subject, .body = action.body},
      ctx.remaining());
  if (!sent) {
    return fail_step(log, "Email send failed", std::move(sent.error()));
  }

  log.append("Email sent successfully");
  return json{{"sent", true}, {"to", action.to}, {"subject", action.subject}};
}

auto ActionExecutor::run(const WebhookAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append(std::format("Calling webhook: {} {}...", action.method, action.url));
  if (!collaborators_.http) {
    return not_configured(log, "Webhook failed", "HTTP transport");
  }

  auto method = http::parse_method(action.method);
  if (!method) {
    return fail_step(log, "Webhook failed",
                     ExecutionError{make_error_code(Error::InvalidArgument),
                                    std::format("Unsupported HTTP method: {}",
                                                action.method)});
  }

  http::HttpRequest request;
  request.method = *method;
  request.url = action.url;
  request.headers["Content-Type"] = "application/json";
  for (const auto& [name, value] : action.headers) {
    request.headers[name] = value;
  }
  if (action.body) {
    request.body = action.body->dump();
  }

  auto response = collaborators_.http->send(request, ctx.remaining());
  if (!response) {
    return fail_step(log, "Webhook failed", std::move(response.error()));
  }

  auto data = json::parse(response->body, nullptr, false);
  if (data.is_discarded()) {
    data = json::object();
  }
  log.append(std::format("Webhook responded with status {}", response->status));

  if (!response->is_success()) {
    return fail_step(log, "Webhook failed",
                     ExecutionError{make_error_code(Error::HttpError),
                                    std::format("Webhook failed with status {}: {}",
                                                response->status, data.dump())});
  }

  return json{{"status", response->status}, {"data", std::move(data)}};
}

auto ActionExecutor::run(const RunCodeAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append(std::format("Running {} code...", code_language_name(action.language)));
  if (!collaborators_.sandbox) {
    return not_configured(log, "Code execution failed", "Code sandbox");
  }

  auto output =
      collaborators_.sandbox->run(action.language, action.code, ctx.remaining());
  if (!output) {
    return fail_step(log, "Code execution failed", std::move(output.error()));
  }

  if (!output->stdout_text.empty()) {
    log.append(std::format("STDOUT: {}",
                           truncate(output->stdout_text, defaults_.output_excerpt)));
  }
  if (!output->stderr_text.empty()) {
    log.append(std::format("STDERR: {}",
                           truncate(output->stderr_text, defaults_.output_excerpt)));
  }

  if (output->exit_code != 0) {
    return fail_step(log, "Code execution failed",
                     ExecutionError{make_error_code(Error::ExecutionFailed),
                                    std::format("Code exited with status {}",
                                                output->exit_code)});
  }

  log.append("Code executed successfully");
  return json{{"stdout", output->stdout_text},
              {"stderr", output->stderr_text},
              {"exitCode", output->exit_code}};
}

auto ActionExecutor::run(const GenerateReportAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append("Generating report...");
  if (!collaborators_.llm) {
    return not_configured(log, "Report generation failed", "LLM client");
  }

  auto completion = collaborators_.llm->complete(
      {.model = defaults_.model,
       .prompt = report_prompt(action.config),
       .max_tokens = defaults_.report_max_tokens},
      ctx.remaining());
  if (!completion) {
    return fail_step(log, "Report generation failed",
                     std::move(completion.error()));
  }

  auto report = completion->text.value_or("Failed to generate report");
  log.append(std::format("Report generated ({} chars)", report.size()));

  return json{{"report", std::move(report)},
              {"generatedAt", format_iso8601(Clock::now())},
              {"config", action.config}};
}

auto ActionExecutor::run(const ChainAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  const auto n = action.tasks.size();
  log.append(std::format("Executing task chain ({} tasks)...", n));

  json results = json::array();
  for (std::size_t i = 0; i < n; ++i) {
    const auto& step = action.tasks[i];
    auto type = step.type_name();

    auto result = [&]() -> Outcome<json> {
      if (auto stop = check_budget(ctx)) {
        return std::unexpected{std::move(*stop)};
      }
      log.append(std::format("Chain step {}/{}: {}", i + 1, n, type));
      return execute(step, log, ctx);
    }();

    if (!result) {
      log.append(std::format("Task chain failed at step {}/{} ({}): {}", i + 1,
                             n, type, result.error().message));
      return std::unexpected{std::move(result.error())};
    }
    results.push_back(
        json{{"step", i + 1}, {"type", std::string(type)}, {"result", *result}});
  }

  log.append("Task chain completed successfully");
  return json{{"chainLength", n}, {"results", std::move(results)}};
}

auto ActionExecutor::run(const WebScrapeAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append(std::format("Scraping {}...", action.url));
  if (!collaborators_.scraper) {
    return not_configured(log, "Web scraping failed", "Web scraper");
  }

  auto result =
      collaborators_.scraper->scrape(action.url, action.selector, ctx.remaining());
  if (!result) {
    return fail_step(log, "Web scraping failed", std::move(result.error()));
  }

  std::size_t items = 0;
  if (auto it = result->find("items"); it != result->end() && it->is_array()) {
    items = it->size();
  }
  log.append(std::format("Scraped {} items", items));
  return std::move(*result);
}

auto ActionExecutor::run(const FileOperationAction& action, ExecutionLog& log,
                         const ExecutionContext&) const -> Outcome<json> {
  log.append(std::format("File operation: {} on {}...", action.operation,
                         action.path));
  log.append("File operation completed");
  return json{{"operation", action.operation},
              {"path", action.path},
              {"success", true}};
}

auto ActionExecutor::run(const GoogleWorkspaceAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const -> Outcome<json> {
  log.append(std::format("Google Workspace: {}.{}...", action.service,
                         action.action));
  if (!collaborators_.workspace) {
    return not_configured(log, "Google Workspace action failed",
                          "Google Workspace client");
  }

  auto result = collaborators_.workspace->execute(
      action.service, action.action, action.params, ctx.remaining());
  if (!result) {
    return fail_step(log, "Google Workspace action failed",
                     std::move(result.error()));
  }

  log.append("Google Workspace action completed");
  return std::move(*result);
}

}  // namespace cadence
