#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/schema/schema_resolver.hpp>

#include "support/temp_repo.hpp"

#include <string>

using namespace workflow_tracker;

namespace {

SourceText Source(const std::string& path, const std::string& text) {
    auto decoded = DecodeSource(path, text);
    REQUIRE(decoded.IsOk());
    return std::move(decoded).Value();
}

constexpr const char* kDbContext = R"(using Microsoft.EntityFrameworkCore;

public class ShopContext : DbContext
{
    public DbSet<Order> Orders { get; set; }
    public DbSet<Customer> Clients { get; set; }
}
)";

constexpr const char* kEntities = R"(namespace Shop.Models
{
    [Table("order_lines")]
    public class OrderLine
    {
        public int Id { get; set; }
        public int Quantity { get; set; }
    }

    public class Dto
    {
        public string Value { get; set; }
    }

    public class Product
    {
        public string Sku { get; set; }
        public decimal Price { get; set; }
        public string Title { get; set; }
    }
}
)";

} // namespace

TEST_CASE("SchemaResolver: DbSet properties name the tables", "[schema][resolver]") {
    SchemaResolver resolver{ScanConfig{}};
    auto schemas = resolver.DetectSchemas(Source("ShopContext.cs", kDbContext));

    REQUIRE(schemas.size() == 2);
    CHECK(schemas[0].entity_name == "Order");
    CHECK(schemas[0].table_name == "Orders");
    CHECK(schemas[0].dbset_name == std::optional<std::string>("Orders"));
    CHECK(schemas[0].line_number == 5);
    CHECK(schemas[0].metadata.at("source") == "DbContext");
    CHECK(schemas[1].entity_name == "Customer");
    CHECK(schemas[1].table_name == "Clients");
}

TEST_CASE("SchemaResolver: entity classes and [Table] attribute", "[schema][resolver]") {
    SchemaResolver resolver{ScanConfig{}};
    auto schemas = resolver.DetectSchemas(Source("Models.cs", kEntities));

    REQUIRE(schemas.size() == 2);
    CHECK(schemas[0].entity_name == "OrderLine");
    CHECK(schemas[0].table_name == "order_lines");
    CHECK(schemas[0].metadata.at("has_table_attribute") == "true");
    CHECK(schemas[0].properties == std::vector<std::string>{"Id", "Quantity"});

    // Dto has one property and is skipped; Product has three.
    CHECK(schemas[1].entity_name == "Product");
    CHECK(schemas[1].table_name == "Product");
    CHECK(schemas[1].metadata.at("has_table_attribute") == "false");
}

TEST_CASE("SchemaResolver: LooksLikeEntity heuristic", "[schema][resolver]") {
    CHECK_FALSE(SchemaResolver::LooksLikeEntity({"Id"}));
    CHECK(SchemaResolver::LooksLikeEntity({"Id", "Total"}));
    CHECK_FALSE(SchemaResolver::LooksLikeEntity({"Total", "Tax"}));
    CHECK(SchemaResolver::LooksLikeEntity({"Total", "Tax", "Discount"}));
}

TEST_CASE("SchemaResolver: Resolve only reads C# files", "[schema][resolver]") {
    testing::TempRepo repo;
    auto context = repo.Write("Data/ShopContext.cs", kDbContext);
    auto script = repo.Write("web/orders.ts", "class Fake { Id; Name; }\n");

    SchemaResolver resolver{ScanConfig{}};
    auto resolution = resolver.Resolve({context, script});

    CHECK(resolution.files_examined == 1);
    CHECK(resolution.warnings.empty());
    CHECK_FALSE(resolution.truncated);
    CHECK(resolution.registry.ResolveTableName("Order") == "Orders");
}

TEST_CASE("SchemaResolver: file cap stops the pass with a warning", "[schema][resolver]") {
    testing::TempRepo repo;
    auto first = repo.Write("A.cs", kDbContext);
    auto second = repo.Write("B.cs", kEntities);

    ScanConfig config;
    config.schema.max_files = 1;
    SchemaResolver resolver{config};
    auto resolution = resolver.Resolve({first, second});

    CHECK(resolution.files_examined == 1);
    CHECK(resolution.truncated);
    REQUIRE(resolution.warnings.size() == 1);
    CHECK(resolution.registry.Find("OrderLine") == nullptr);
}

TEST_CASE("SchemaResolver: unreadable file becomes a warning", "[schema][resolver]") {
    testing::TempRepo repo;
    auto good = repo.Write("Good.cs", kDbContext);
    auto binary = repo.Write("Bad.cs", std::string("class X\0Y", 9));

    SchemaResolver resolver{ScanConfig{}};
    auto resolution = resolver.Resolve({binary, repo.Path("Missing.cs"), good});

    CHECK(resolution.warnings.size() == 2);
    CHECK(resolution.registry.Find("Order") != nullptr);
}

TEST_CASE("SchemaResolver: cancellation stops before the next file", "[schema][resolver]") {
    testing::TempRepo repo;
    auto context = repo.Write("ShopContext.cs", kDbContext);

    CancellationToken cancel;
    cancel.RequestCancel();
    SchemaResolver resolver{ScanConfig{}};
    auto resolution = resolver.Resolve({context}, &cancel);

    CHECK(resolution.files_examined == 0);
    CHECK(resolution.registry.Empty());
}
