#include <Forerunner/parallel/exception.hxx>

using namespace Forerunner::Parallel;

Exception::Exception(const std::string& message): StormByte::Exception(message) {}

InsufficientData::InsufficientData(const std::string& message): Exception(message) {}

InvalidOptions::InvalidOptions(const std::string& message): Exception(message) {}

TransformFault::TransformFault(std::size_t worker, const std::string& reason):
Exception("Transform failed in worker " + std::to_string(worker) + ": " + reason),
m_worker(worker), m_reason(reason) {}
