#ifndef NODEHUB_BROKER_EMPTY_EVENT_NOTIFIER_H
#define NODEHUB_BROKER_EMPTY_EVENT_NOTIFIER_H

#include "event_notifier.h"


/**
 * Used when no webhook is configured.
 */
class empty_event_notifier : public event_notifier_interface
{
public:
	void error(const std::string &) override
	{
	}

	void node_online(const std::string &, const std::string &) override
	{
	}

	void node_offline(const std::string &, const std::string &) override
	{
	}

	void task_status(const std::string &, const std::string &, const std::string & = "") override
	{
	}
};

#endif // NODEHUB_BROKER_EMPTY_EVENT_NOTIFIER_H
