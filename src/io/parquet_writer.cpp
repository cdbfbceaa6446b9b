#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <functional>
#include <memory>
#include <vector>
#endif

namespace paycalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> build_double_column(
    const Projection& projection,
    const std::string& name,
    const std::function<double(const ProjectionSnapshot&)>& value_of)
{
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(projection.size())), "reserve " + name + " column");
    for (const auto& snapshot : projection) {
        check(builder.Append(value_of(snapshot)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

std::shared_ptr<arrow::Array> build_int_column(
    const Projection& projection,
    const std::string& name,
    const std::function<int32_t(const ProjectionSnapshot&)>& value_of)
{
    arrow::Int32Builder builder;
    check(builder.Reserve(static_cast<int64_t>(projection.size())), "reserve " + name + " column");
    for (const auto& snapshot : projection) {
        check(builder.Append(value_of(snapshot)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_projection(const Projection& projection, const std::string& filepath) {
    if (projection.empty()) {
        throw std::runtime_error("Projection has no months to write");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> columns;

    // Month column
    arrow::StringBuilder month_builder;
    for (const auto& snapshot : projection) {
        check(month_builder.Append(snapshot.month.to_string()), "append month");
    }
    std::shared_ptr<arrow::Array> month_array;
    check(month_builder.Finish(&month_array), "finish month array");
    fields.push_back(arrow::field("month", arrow::utf8()));
    columns.push_back(month_array);

    auto add_int = [&](const std::string& name, std::function<int32_t(const ProjectionSnapshot&)> fn) {
        fields.push_back(arrow::field(name, arrow::int32()));
        columns.push_back(build_int_column(projection, name, fn));
    };
    auto add_double = [&](const std::string& name, std::function<double(const ProjectionSnapshot&)> fn) {
        fields.push_back(arrow::field(name, arrow::float64()));
        columns.push_back(build_double_column(projection, name, fn));
    };

    add_int("workdays", [](const ProjectionSnapshot& s) { return s.payroll.workdays; });
    add_int("rest_days", [](const ProjectionSnapshot& s) { return s.payroll.rest_days; });
    add_int("benefit_days", [](const ProjectionSnapshot& s) { return s.payroll.benefit_days; });
    add_double("dsr", [](const ProjectionSnapshot& s) { return s.payroll.dsr; });
    add_double("gross_salary", [](const ProjectionSnapshot& s) { return s.payroll.gross_salary; });
    add_double("inss", [](const ProjectionSnapshot& s) { return s.payroll.inss; });
    add_double("irrf", [](const ProjectionSnapshot& s) { return s.payroll.irrf; });
    add_double("net_salary", [](const ProjectionSnapshot& s) { return s.payroll.net_salary; });
    add_double("benefits", [](const ProjectionSnapshot& s) { return s.payroll.benefits; });
    add_double("net_income", [](const ProjectionSnapshot& s) { return s.payroll.net_income; });
    add_double("fixed_total", [](const ProjectionSnapshot& s) { return s.fixed_total; });
    add_double("installment_total", [](const ProjectionSnapshot& s) { return s.installment_total; });
    add_double("total_expenses", [](const ProjectionSnapshot& s) { return s.total_expenses; });
    add_double("free_balance", [](const ProjectionSnapshot& s) { return s.free_balance; });
    add_double("investment_target", [](const ProjectionSnapshot& s) { return s.investment_target; });
    add_int("active_installments", [](const ProjectionSnapshot& s) {
        return static_cast<int32_t>(s.active_installments.size());
    });

    auto table = arrow::Table::Make(arrow::schema(fields), columns);

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto open_result = arrow::io::FileOutputStream::Open(filepath);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 open_result.status().ToString());
    }
    outfile = *open_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_projection(const Projection& /* projection */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace paycalc
