/**
 * @file
 *
 * Implementation of scoped_temp_file.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_file.h"

#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/FileStream.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>

#include <iostream>

using namespace test_helpers;

scoped_temp_file::scoped_temp_file(const std::string& initial_content,
                                   const std::string& extension):
	m_path(Poco::Path::temp() + "meshbridge-" +
	       Poco::UUIDGenerator::defaultGenerator().create().toString())
{
	if(!extension.empty())
	{
		m_path += "." + extension;
	}

	write(initial_content);
}

scoped_temp_file::~scoped_temp_file()
{
	try
	{
		Poco::File(m_path).remove();
	}
	catch(const Poco::Exception& ex)
	{
		std::cerr << "unable to remove " << m_path << ": " << ex.displayText()
		          << std::endl;
	}
}

const std::string& scoped_temp_file::path() const
{
	return m_path;
}

void scoped_temp_file::write(const std::string& content) const
{
	Poco::FileOutputStream out(m_path, std::ios::out | std::ios::trunc);

	out << content;
	out.close();
}

std::string scoped_temp_file::read() const
{
	std::string content;
	Poco::FileInputStream in(m_path);

	Poco::StreamCopier::copyToString(in, content);
	return content;
}
