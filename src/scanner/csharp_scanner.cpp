#include <workflow_tracker/scanner/csharp_scanner.hpp>

#include <workflow_tracker/scanner/scanner_support.hpp>

#include <algorithm>

namespace workflow_tracker {

namespace {

constexpr const char* kServiceBus = "Azure Service Bus";
constexpr const char* kRabbitMq = "RabbitMQ";

std::string JoinLines(const std::vector<std::string>& lines, int first, int last) {
    std::string out;
    for (int i = first; i < last; ++i) {
        if (i > first) {
            out += '\n';
        }
        out += lines[static_cast<std::size_t>(i)];
    }
    return out;
}

} // namespace

CSharpScanner::CSharpScanner(const ScanConfig& config)
    : detect_(config.detect),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      ef_reads_(BuildTable({
          R"(\.Where\s*\()",
          R"(\.Select\s*\()",
          R"(\.FirstOrDefault\s*\()",
          R"(\.ToList\s*\()",
          R"(\.Include\s*\()",
          R"(\.FromSql)",
      })),
      ef_writes_(BuildTable({
          R"(\.Add\s*\()",
          R"(\.Update\s*\()",
          R"(\.Remove\s*\()",
          R"(\.SaveChanges)",
          R"(\.SaveChangesAsync)",
      })),
      http_(BuildTable({
          R"(HttpClient)",
          R"(\.GetAsync\s*\()",
          R"(\.PostAsync\s*\()",
          R"(\.PutAsync\s*\()",
          R"(\.DeleteAsync\s*\()",
          R"(\.SendAsync\s*\()",
      })),
      file_io_(BuildTable({
          R"(File\.ReadAllText)",
          R"(File\.WriteAllText)",
          R"(File\.ReadAllLines)",
          R"(File\.WriteAllLines)",
          R"(StreamReader)",
          R"(StreamWriter)",
          R"(FileStream)",
      })),
      messaging_(BuildTable({
          {R"(ServiceBusSender)", kServiceBus},
          {R"(ServiceBusReceiver)", kServiceBus},
          {R"(SendMessageAsync)", kServiceBus},
          {R"(ReceiveMessageAsync)", kServiceBus},
          {R"(IModel\.BasicPublish)", kRabbitMq},
          {R"(IModel\.BasicConsume)", kRabbitMq},
          {R"(QueueDeclare)", kRabbitMq},
      })),
      http_methods_(BuildTable({
          {R"(GETAsync|\.GET\()", "GET"},
          {R"(POSTAsync|\.POST\()", "POST"},
          {R"(PUTAsync|\.PUT\()", "PUT"},
          {R"(DELETEAsync|\.DELETE\()", "DELETE"},
          {R"(PATCHAsync|\.PATCH\()", "PATCH"},
      }, /*icase=*/true)),
      raw_sql_(R"(SqlCommand|SqlDataAdapter|ExecuteReader|ExecuteScalar)"),
      sql_literal_(R"lit("(SELECT|INSERT|UPDATE|DELETE)[\s\S]*?")lit", std::regex::icase),
      table_ref_(R"(DbSet<(\w+)>|_context\.(\w+)|_db\.(\w+))"),
      var_decl_(R"(var\s+\w+\s*=\s*\w+\.(\w+))"),
      endpoint_(R"lit("(https?://[^"]+|/[^"]*)")lit"),
      api_endpoint_(R"lit("(https?://[^"]+|/api/[^"]*)")lit"),
      file_literal_(R"lit("([^"]*\.[a-zA-Z]{2,4})")lit"),
      read_hint_(R"(Read|Reader)"),
      send_hint_(R"(Send|Sender)"),
      publish_hint_(R"(Publish)"),
      string_literal_(R"lit("([^"]+)")lit"),
      queue_decl_(R"lit(queueName\s*=\s*"([^"]+)"|CreateQueue\("([^"]+)")lit") {}

bool CSharpScanner::CanScan(const std::string& file_path) const {
    return EndsWith(file_path, ".cs");
}

Result<WorkflowGraph, Error> CSharpScanner::ScanFile(
    const std::string& file_path, const SchemaRegistry* schemas) const {
    auto source = LoadSource(file_path, max_line_length_);
    if (source.IsErr()) {
        return Result<WorkflowGraph, Error>::Err(std::move(source).Error());
    }
    WorkflowGraph fragment;
    ScanSource(source.Value(), schemas, detect_, fragment);
    return Result<WorkflowGraph, Error>::Ok(std::move(fragment));
}

void CSharpScanner::ScanSource(const SourceText& source, const SchemaRegistry* schemas,
                               const DetectionToggles& detect,
                               WorkflowGraph& fragment) const {
    const int count = static_cast<int>(source.lines.size());
    for (int line = 1; line <= count; ++line) {
        ScanLine(source, line, schemas, detect, fragment);
    }
}

void CSharpScanner::ScanLine(const SourceText& source, int line_number,
                             const SchemaRegistry* schemas,
                             const DetectionToggles& detect,
                             WorkflowGraph& fragment) const {
    if (detect.database) {
        ScanDatabase(source, line_number, schemas, fragment);
    }
    if (detect.api_calls) {
        ScanHttp(source, line_number, fragment);
    }
    if (detect.file_io) {
        ScanFileIo(source, line_number, fragment);
    }
    if (detect.message_queues) {
        ScanMessaging(source, line_number, fragment);
    }
}

void CSharpScanner::ScanDatabase(const SourceText& source, int line_number,
                                 const SchemaRegistry* schemas,
                                 WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];

    if (const auto* rule = FirstMatch(ef_reads_, text)) {
        auto table = ExtractTableName(source.lines, line_number, schemas);
        auto node = MakeNode(source, "db_read", line_number, WorkflowType::DatabaseRead,
                             "DB Query: " + table.value_or("Unknown"),
                             "Database query operation");
        node.table_name = std::move(table);
        node.metadata["pattern"] = rule->label;
        fragment.AddNode(std::move(node));
    }

    if (const auto* rule = FirstMatch(ef_writes_, text)) {
        auto table = ExtractTableName(source.lines, line_number, schemas);
        auto node = MakeNode(source, "db_write", line_number, WorkflowType::DatabaseWrite,
                             "DB Write: " + table.value_or("Unknown"),
                             "Database write operation");
        node.table_name = std::move(table);
        node.metadata["pattern"] = rule->label;
        fragment.AddNode(std::move(node));
    }

    if (Contains(raw_sql_, text)) {
        auto node = MakeNode(source, "sql", line_number, WorkflowType::DatabaseRead,
                             "SQL Query", "Raw SQL query execution");
        node.query = ExtractSqlQuery(source.lines, line_number);
        fragment.AddNode(std::move(node));
    }
}

void CSharpScanner::ScanHttp(const SourceText& source, int line_number,
                             WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(http_, text) == nullptr) {
        return;
    }
    auto method = ExtractHttpMethod(text);
    auto node = MakeNode(source, "api", line_number, WorkflowType::ApiCall,
                         "API Call: " + method, "HTTP API call");
    node.endpoint = ExtractEndpoint(source.lines, line_number);
    node.method = std::move(method);
    fragment.AddNode(std::move(node));
}

void CSharpScanner::ScanFileIo(const SourceText& source, int line_number,
                               WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(file_io_, text) == nullptr) {
        return;
    }
    const bool is_read = Contains(read_hint_, text);
    auto node = MakeNode(source, "file", line_number,
                         is_read ? WorkflowType::FileRead : WorkflowType::FileWrite,
                         is_read ? "File Read" : "File Write",
                         is_read ? "File read operation" : "File write operation");
    node.file_path = SearchGroup(file_literal_, text);
    fragment.AddNode(std::move(node));
}

void CSharpScanner::ScanMessaging(const SourceText& source, int line_number,
                                  WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    const auto* rule = FirstMatch(messaging_, text);
    if (rule == nullptr) {
        return;
    }

    const bool rabbit = rule->value == kRabbitMq;
    const bool outbound = Contains(rabbit ? publish_hint_ : send_hint_, text);
    std::string verb;
    if (rabbit) {
        verb = outbound ? "Publish" : "Consume";
    } else {
        verb = outbound ? "Send" : "Receive";
    }

    auto node = MakeNode(source, "msg", line_number,
                         outbound ? WorkflowType::MessageSend : WorkflowType::MessageReceive,
                         "Message " + verb, rule->value + " message operation");
    node.queue_name = ExtractQueueName(source.lines, line_number);
    node.metadata["platform"] = rule->value;
    fragment.AddNode(std::move(node));
}

std::optional<std::string> CSharpScanner::ExtractTableName(
    const std::vector<std::string>& lines, int line_number,
    const SchemaRegistry* schemas) const {
    auto entity = SearchGroup(table_ref_, lines[static_cast<std::size_t>(line_number - 1)]);

    if (!entity.has_value()) {
        // Current line plus the four before it.
        for (int i = std::max(0, line_number - 5); i < line_number; ++i) {
            entity = SearchGroup(var_decl_, lines[static_cast<std::size_t>(i)]);
            if (entity.has_value()) {
                break;
            }
        }
    }

    if (entity.has_value() && schemas != nullptr) {
        return schemas->ResolveTableName(*entity);
    }
    return entity;
}

std::optional<std::string> CSharpScanner::ExtractSqlQuery(
    const std::vector<std::string>& lines, int line_number) const {
    const int count = static_cast<int>(lines.size());
    const auto context = JoinLines(lines, std::max(0, line_number - 3),
                                   std::min(count, line_number + 3));
    std::smatch match;
    if (std::regex_search(context, match, sql_literal_)) {
        return match[0].str();
    }
    return std::nullopt;
}

std::optional<std::string> CSharpScanner::ExtractEndpoint(
    const std::vector<std::string>& lines, int line_number) const {
    if (auto url = SearchGroup(endpoint_, lines[static_cast<std::size_t>(line_number - 1)])) {
        return url;
    }
    const int count = static_cast<int>(lines.size());
    for (int i = std::max(0, line_number - 3); i < std::min(count, line_number + 1); ++i) {
        if (auto url = SearchGroup(api_endpoint_, lines[static_cast<std::size_t>(i)])) {
            return url;
        }
    }
    return std::nullopt;
}

std::string CSharpScanner::ExtractHttpMethod(const std::string& line) const {
    if (const auto* rule = FirstMatch(http_methods_, line)) {
        return rule->value;
    }
    return "HTTP";
}

std::optional<std::string> CSharpScanner::ExtractQueueName(
    const std::vector<std::string>& lines, int line_number) const {
    if (auto name = SearchGroup(string_literal_, lines[static_cast<std::size_t>(line_number - 1)])) {
        return name;
    }
    const int count = static_cast<int>(lines.size());
    for (int i = std::max(0, line_number - 5); i < std::min(count, line_number + 1); ++i) {
        if (auto name = SearchGroup(queue_decl_, lines[static_cast<std::size_t>(i)])) {
            return name;
        }
    }
    return std::nullopt;
}

} // namespace workflow_tracker
